#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "error.hpp"
#include "program.hpp"

namespace stratalog {

struct stratum_plan {
    int number = 0;
    std::vector<size_t> symbols;
    std::vector<size_t> rules;  // constraints with an atom head, program order
    std::vector<size_t> checks; // headless constraints run after the fixpoint
};

struct schedule {
    std::vector<stratum_plan> strata;
    // Headless constraints of a program without symbols.
    std::vector<size_t> final_checks;
};

namespace detail {

template <typename F> void for_each_body_atom(const constraint &c, F &&f) {
    for (const auto &l : c.body) {
        if (const auto *p = std::get_if<positive_atom>(&l))
            f(p->symbol, false);
        else if (const auto *n = std::get_if<negative_atom>(&l))
            f(n->symbol, true);
    }
}

inline const symbol &symbol_for(const program &p, const constraint &c,
                                const std::string &name) {
    const symbol *s = p.find(name);
    if (!s)
        throw std::invalid_argument("constraint '" + c.name +
                                    "' references unknown symbol '" + name + "'");
    return *s;
}

} // namespace detail

// Orders evaluation by stratum number and checks that every constraint only
// reads finalized or same-stratum symbols as its literals require.
inline schedule make_schedule(const program &p) {
    std::map<int, stratum_plan> by_number;
    for (size_t i = 0; i < p.symbols().size(); ++i) {
        auto &plan = by_number[p.get(i).stratum];
        plan.number = p.get(i).stratum;
        plan.symbols.push_back(i);
    }

    std::vector<std::pair<size_t, int>> pending_checks;
    const auto &cs = p.constraints();
    for (size_t ci = 0; ci < cs.size(); ++ci) {
        const constraint &c = cs[ci];
        if (!c.is_check()) {
            const auto &h = std::get<atom_head>(c.hd);
            const symbol &hs = detail::symbol_for(p, c, h.symbol);
            detail::for_each_body_atom(c, [&](const std::string &name, bool negated) {
                const symbol &bs = detail::symbol_for(p, c, name);
                if (negated && bs.stratum >= hs.stratum)
                    throw stratification_invariant_violation(
                        c.name, name,
                        "negated symbol must belong to a strictly earlier stratum");
                if (!negated && bs.stratum > hs.stratum)
                    throw stratification_invariant_violation(
                        c.name, name, "symbol belongs to a later stratum");
            });
            by_number[hs.stratum].rules.push_back(ci);
        } else {
            int at = by_number.empty() ? 0 : by_number.begin()->first;
            detail::for_each_body_atom(c, [&](const std::string &name, bool) {
                at = std::max(at, detail::symbol_for(p, c, name).stratum);
            });
            pending_checks.emplace_back(ci, at);
        }
    }

    schedule out;
    if (by_number.empty()) {
        for (const auto &[ci, at] : pending_checks)
            out.final_checks.push_back(ci);
        return out;
    }
    for (const auto &[ci, at] : pending_checks)
        by_number[at].checks.push_back(ci);
    for (auto &[n, plan] : by_number)
        out.strata.push_back(std::move(plan));
    return out;
}

} // namespace stratalog
