#pragma once

#include "error.hpp"
#include "functions.hpp"
#include "log.hpp"
#include "minimizer.hpp"
#include "model.hpp"
#include "options.hpp"
#include "program.hpp"
#include "solver.hpp"
#include "stratum.hpp"
#include "table.hpp"
#include "value.hpp"
