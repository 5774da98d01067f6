#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "error.hpp"
#include "options.hpp"
#include "value.hpp"

namespace stratalog {

enum class purity { pure, impure };

using scalar_fn = std::function<value(std::span<const value>)>;

// Named scalar callables used by filters, term applications and lattice
// operators. Open for registration until frozen; a solver only accepts a
// frozen table.
class function_table {
    struct entry {
        std::string name;
        scalar_fn fn;
        purity kind;
    };

    std::vector<entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    bool allow_impure_ = false;
    bool frozen_ = false;

  public:
    function_table() = default;
    explicit function_table(const options &opts)
        : allow_impure_(opts.allow_impure) {}

    function_table &add(std::string name, scalar_fn fn,
                        purity kind = purity::pure) {
        if (frozen_)
            throw configuration_error("function table is frozen; cannot add '" +
                                      name + "'");
        if (!fn)
            throw configuration_error("function '" + name + "' is empty");
        if (kind == purity::impure && !allow_impure_)
            throw configuration_error("impure function '" + name +
                                      "' requires allow_impure");
        if (index_.count(name))
            throw configuration_error("function '" + name +
                                      "' is already registered");
        index_.emplace(name, entries_.size());
        entries_.push_back({std::move(name), std::move(fn), kind});
        return *this;
    }

    // Registers a boolean-valued callable, for use as a filter or `leq`.
    function_table &add_predicate(std::string name,
                                  std::function<bool(std::span<const value>)> pred,
                                  purity kind = purity::pure) {
        if (!pred)
            throw configuration_error("function '" + name + "' is empty");
        return add(
            std::move(name),
            [p = std::move(pred)](std::span<const value> args) {
                return value::boolean(p(args));
            },
            kind);
    }

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }
    size_t size() const { return entries_.size(); }

    const scalar_fn *find(std::string_view name) const {
        auto it = index_.find(std::string(name));
        return it != index_.end() ? &entries_[it->second].fn : nullptr;
    }

    const scalar_fn &get(std::string_view name) const {
        if (auto *fn = find(name))
            return *fn;
        throw configuration_error("unknown function '" + std::string(name) + "'");
    }

    purity purity_of(std::string_view name) const {
        auto it = index_.find(std::string(name));
        if (it == index_.end())
            throw configuration_error("unknown function '" + std::string(name) + "'");
        return entries_[it->second].kind;
    }
};

} // namespace stratalog
