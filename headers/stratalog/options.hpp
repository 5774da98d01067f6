#pragma once

#include "log.hpp"

namespace stratalog {

// How closely a trial failure must resemble the original one for the delta
// minimizer to count it as a reproduction.
enum class strictness {
    any_failure,
    same_kind,
    same_message,
};

struct options {
    bool allow_impure = false;
    strictness minimize_strictness = strictness::any_failure;
    log_level verbosity = log_level::warn;

    void apply_logging() const { set_log_level(verbosity); }
};

} // namespace stratalog
