#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "value.hpp"

namespace stratalog {

enum class failure_kind {
    none,
    unsatisfiable_constraint,
    scalar_function_failure,
    reproduction_failure,
    stratification_invariant_violation,
    configuration_error,
    other,
};

inline const char *to_string(failure_kind k) {
    switch (k) {
    case failure_kind::none: return "none";
    case failure_kind::unsatisfiable_constraint: return "unsatisfiable constraint";
    case failure_kind::scalar_function_failure: return "scalar function failure";
    case failure_kind::reproduction_failure: return "reproduction failure";
    case failure_kind::stratification_invariant_violation:
        return "stratification invariant violation";
    case failure_kind::configuration_error: return "configuration error";
    case failure_kind::other: return "other";
    }
    return "unknown";
}

struct binding {
    std::string variable;
    value val;
};
using bindings = std::vector<binding>;

inline std::string bindings_to_string(const bindings &env) {
    if (env.empty())
        return "no bindings";
    std::string out;
    for (size_t i = 0; i < env.size(); ++i) {
        if (i)
            out += ", ";
        out += env[i].variable + " = " + env[i].val.to_literal();
    }
    return out;
}

class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Raised while evaluating a constraint body or head; carries the constraint
// and the variable bindings at the point of failure.
class evaluation_error : public error {
  public:
    evaluation_error(const std::string &what, std::string constraint,
                     bindings env)
        : error(what + " [constraint '" + constraint + "' with " +
                bindings_to_string(env) + "]"),
          constraint_(std::move(constraint)), env_(std::move(env)) {}

    const std::string &constraint() const { return constraint_; }
    const bindings &env() const { return env_; }

  private:
    std::string constraint_;
    bindings env_;
};

class unsatisfiable_constraint : public evaluation_error {
  public:
    unsatisfiable_constraint(std::string constraint, bindings env)
        : evaluation_error("unsatisfiable constraint", std::move(constraint),
                           std::move(env)) {}
};

class scalar_function_failure : public evaluation_error {
  public:
    scalar_function_failure(std::string function, const std::string &cause,
                            std::string constraint, bindings env)
        : evaluation_error("scalar function '" + function + "' failed: " + cause,
                           std::move(constraint), std::move(env)),
          function_(std::move(function)) {}

    const std::string &function() const { return function_; }

  private:
    std::string function_;
};

class stratification_invariant_violation : public error {
  public:
    stratification_invariant_violation(std::string constraint, std::string symbol,
                                       const std::string &detail)
        : error("stratification invariant violated in constraint '" +
                constraint + "' reading '" + symbol + "': " + detail),
          constraint_(std::move(constraint)), symbol_(std::move(symbol)) {}

    const std::string &constraint() const { return constraint_; }
    const std::string &symbol() const { return symbol_; }

  private:
    std::string constraint_;
    std::string symbol_;
};

class reproduction_failure : public error {
  public:
    using error::error;
};

class configuration_error : public error {
  public:
    using error::error;
};

inline failure_kind kind_of(const std::exception &e) {
    if (dynamic_cast<const unsatisfiable_constraint *>(&e))
        return failure_kind::unsatisfiable_constraint;
    if (dynamic_cast<const scalar_function_failure *>(&e))
        return failure_kind::scalar_function_failure;
    if (dynamic_cast<const reproduction_failure *>(&e))
        return failure_kind::reproduction_failure;
    if (dynamic_cast<const stratification_invariant_violation *>(&e))
        return failure_kind::stratification_invariant_violation;
    if (dynamic_cast<const configuration_error *>(&e))
        return failure_kind::configuration_error;
    return failure_kind::other;
}

} // namespace stratalog
