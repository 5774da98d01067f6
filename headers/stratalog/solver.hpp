#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"
#include "functions.hpp"
#include "log.hpp"
#include "model.hpp"
#include "options.hpp"
#include "program.hpp"
#include "simd.hpp"
#include "stratum.hpp"
#include "table.hpp"
#include "value.hpp"

namespace stratalog {

struct solve_stats {
    std::vector<size_t> rounds; // per stratum, in evaluation order
    size_t inserted = 0;
    size_t merged = 0;
    // Row count of every symbol, by symbol id, after each round.
    std::vector<std::vector<size_t>> extents;
};

namespace detail {

struct compiled_term;

struct term_slot {
    size_t slot;
};
struct term_const {
    value val;
};
struct term_call {
    std::string name;
    const scalar_fn *fn = nullptr;
    std::vector<compiled_term> args;
};
struct compiled_term {
    std::variant<term_slot, term_const, term_call> node;
};

enum class column_mode { key, bind, check, ignore };

struct column_plan {
    column_mode mode = column_mode::ignore;
    compiled_term key;
    size_t slot = 0;
};

struct compiled_atom {
    size_t sym = 0;
    bool lattice = false;
    bool negated = false;
    bool recursive = false; // reads a symbol of the head's own stratum
    column_mask mask = 0;
    std::vector<column_plan> cols;
};
struct compiled_filter {
    std::string name;
    const scalar_fn *fn = nullptr;
    std::vector<compiled_term> args;
};
struct compiled_guard {
    compiled_term lhs;
    compiled_term rhs;
};
struct compiled_loop {
    size_t slot = 0;
    bool check = false;
    compiled_term collection;
};

using compiled_literal =
    std::variant<compiled_atom, compiled_filter, compiled_guard, compiled_loop>;

enum class head_kind { atom, pass, fail };

struct compiled_constraint {
    std::string name;
    head_kind kind = head_kind::atom;
    size_t head_sym = 0;
    bool head_lattice = false;
    std::vector<compiled_term> head_terms;
    std::vector<compiled_literal> body;
    // Slots bound before each literal; the last entry is for the head.
    // Slots are numbered in binding order, so this is a prefix length.
    std::vector<size_t> bound_before;
    std::vector<std::string> slot_names;
    std::vector<size_t> recursive_atoms;
};

// Resolves names to symbol ids, variable slots and function pointers.
class constraint_compiler {
    const program &p_;
    const function_table &fns_;
    const constraint &c_;
    int stratum_;
    compiled_constraint out_;
    std::unordered_map<std::string, size_t> slots_;

    [[noreturn]] void fail(const std::string &what) const {
        throw std::invalid_argument("constraint '" + c_.name + "': " + what);
    }

    const symbol &lookup_symbol(const std::string &name, size_t &id) const {
        const symbol *s = p_.find(name);
        if (!s)
            fail("unknown symbol '" + name + "'");
        id = p_.symbol_id(name);
        return *s;
    }

    size_t new_slot(const std::string &name) {
        out_.slot_names.push_back(name);
        return out_.slot_names.size() - 1;
    }

    compiled_term compile_term(const term &t) {
        return std::visit(
            [&](const auto &n) -> compiled_term {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, variable>) {
                    auto it = slots_.find(n.name);
                    if (it == slots_.end())
                        fail("variable '" + n.name + "' is not bound by an earlier literal");
                    return {term_slot{it->second}};
                } else if constexpr (std::is_same_v<T, constant>) {
                    return {term_const{n.val}};
                } else {
                    term_call tc{n.function, &fns_.get(n.function), {}};
                    for (const auto &a : n.args)
                        tc.args.push_back(compile_term(a));
                    return {std::move(tc)};
                }
            },
            t.node);
    }

    std::vector<compiled_term> compile_terms(const std::vector<term> &ts) {
        std::vector<compiled_term> out;
        for (const auto &t : ts)
            out.push_back(compile_term(t));
        return out;
    }

    compiled_atom compile_atom(const std::string &name, const std::vector<term> &terms,
                               bool negated) {
        compiled_atom a;
        const symbol &s = lookup_symbol(name, a.sym);
        if (terms.size() != s.arity)
            fail("atom '" + name + "' has " + std::to_string(terms.size()) +
                 " terms, expected " + std::to_string(s.arity));
        a.lattice = s.is_lattice();
        a.negated = negated;
        a.recursive = !negated && s.stratum == stratum_;

        std::unordered_map<std::string, size_t> fresh;
        for (size_t i = 0; i < terms.size(); ++i) {
            column_plan col;
            const auto *v = std::get_if<variable>(&terms[i].node);
            if (v && v->name == "_") {
                col.mode = column_mode::ignore;
            } else if (v && !slots_.count(v->name)) {
                if (auto it = fresh.find(v->name); it != fresh.end()) {
                    col.mode = column_mode::check;
                    col.slot = it->second;
                } else if (negated) {
                    col.mode = column_mode::ignore;
                } else {
                    col.mode = column_mode::bind;
                    col.slot = new_slot(v->name);
                    fresh.emplace(v->name, col.slot);
                }
            } else {
                col.mode = column_mode::key;
                col.key = compile_term(terms[i]);
                if (!(a.lattice && i + 1 == terms.size()))
                    a.mask |= column_bit(i);
            }
            a.cols.push_back(std::move(col));
        }
        for (const auto &[n, slot] : fresh)
            slots_.emplace(n, slot);
        return a;
    }

    compiled_literal compile_literal(const literal &l) {
        return std::visit(
            [&](const auto &n) -> compiled_literal {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, positive_atom>) {
                    return compile_atom(n.symbol, n.terms, false);
                } else if constexpr (std::is_same_v<T, negative_atom>) {
                    return compile_atom(n.symbol, n.terms, true);
                } else if constexpr (std::is_same_v<T, filter_call>) {
                    return compiled_filter{n.function, &fns_.get(n.function),
                                           compile_terms(n.args)};
                } else if constexpr (std::is_same_v<T, inequality>) {
                    return compiled_guard{compile_term(n.lhs), compile_term(n.rhs)};
                } else {
                    compiled_loop lp;
                    lp.collection = compile_term(n.collection);
                    if (auto it = slots_.find(n.variable); it != slots_.end()) {
                        lp.check = true;
                        lp.slot = it->second;
                    } else {
                        lp.slot = new_slot(n.variable);
                        slots_.emplace(n.variable, lp.slot);
                    }
                    return lp;
                }
            },
            l);
    }

  public:
    constraint_compiler(const program &p, const function_table &fns,
                        const constraint &c)
        : p_(p), fns_(fns), c_(c), stratum_(-1) {}

    compiled_constraint compile() {
        out_.name = c_.name;
        const auto *h = std::get_if<atom_head>(&c_.hd);
        if (h) {
            const symbol &s = lookup_symbol(h->symbol, out_.head_sym);
            if (h->terms.size() != s.arity)
                fail("head has " + std::to_string(h->terms.size()) +
                     " terms, expected " + std::to_string(s.arity));
            out_.kind = head_kind::atom;
            out_.head_lattice = s.is_lattice();
            stratum_ = s.stratum;
        } else {
            out_.kind = std::holds_alternative<false_head>(c_.hd) ? head_kind::fail
                                                                  : head_kind::pass;
        }

        for (size_t i = 0; i < c_.body.size(); ++i) {
            out_.bound_before.push_back(out_.slot_names.size());
            out_.body.push_back(compile_literal(c_.body[i]));
            if (const auto *a = std::get_if<compiled_atom>(&out_.body.back());
                a && a->recursive && h)
                out_.recursive_atoms.push_back(i);
        }
        out_.bound_before.push_back(out_.slot_names.size());
        if (h)
            out_.head_terms = compile_terms(h->terms);
        return std::move(out_);
    }
};

struct symbol_delta {
    row_id lo = 0;
    row_id hi = 0;
    simd::mask_t changed;

    bool empty() const {
        return lo == hi && !simd::any(changed.data(), changed.size());
    }
};

struct pending_fact {
    size_t sym;
    fact values;
    size_t constraint;
};

inline constexpr size_t no_delta = SIZE_MAX;

// One solve: owns the table store and drives every stratum to its fixpoint.
class evaluation {
    const program &p_;
    const schedule &sched_;
    const std::vector<compiled_constraint> &cs_;
    table_store store_;
    std::vector<symbol_delta> deltas_;
    std::vector<pending_fact> pending_;
    solve_stats stats_;

    std::vector<value> env_;
    const compiled_constraint *current_ = nullptr;
    size_t current_bound_ = 0;
    size_t delta_lit_ = no_delta;
    const pending_fact *applying_ = nullptr;

    bindings current_bindings() const {
        bindings out;
        if (applying_) {
            const symbol &s = p_.get(applying_->sym);
            for (size_t i = 0; i < applying_->values.size(); ++i)
                out.push_back({s.attribute(i), applying_->values[i]});
            return out;
        }
        if (!current_)
            return out;
        for (size_t i = 0; i < current_bound_ && i < env_.size(); ++i)
            out.push_back({current_->slot_names[i], env_[i]});
        return out;
    }

    std::string context_name() const {
        return current_ ? current_->name : std::string("<input facts>");
    }

    value invoke(const std::string &name, const scalar_fn &fn,
                 std::span<const value> args) {
        try {
            return fn(args);
        } catch (const std::exception &e) {
            std::throw_with_nested(scalar_function_failure(
                name, e.what(), context_name(), current_bindings()));
        } catch (...) {
            std::throw_with_nested(scalar_function_failure(
                name, "unknown exception", context_name(), current_bindings()));
        }
    }

    auto caller() {
        return [this](const std::string &name, const scalar_fn &fn,
                      std::span<const value> args) { return invoke(name, fn, args); };
    }

    value eval(const compiled_term &t) {
        return std::visit(
            [&](const auto &n) -> value {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, term_slot>) {
                    return env_[n.slot];
                } else if constexpr (std::is_same_v<T, term_const>) {
                    return n.val;
                } else {
                    std::vector<value> args;
                    args.reserve(n.args.size());
                    for (const auto &a : n.args)
                        args.push_back(eval(a));
                    return invoke(n.name, *n.fn, args);
                }
            },
            t.node);
    }

    match_range select(const compiled_atom &a, size_t li, const fact &key) {
        row_id n = store_.size(a.sym);
        if (!a.recursive || delta_lit_ == no_delta)
            return store_.lookup(a.sym, a.mask, key, 0, n);
        const symbol_delta &d = deltas_[a.sym];
        if (li == delta_lit_) {
            if (a.lattice)
                return store_.lookup(a.sym, a.mask, key, 0, n, &d.changed);
            return store_.lookup(a.sym, a.mask, key, d.lo, d.hi);
        }
        if (li < delta_lit_ && !a.lattice)
            return store_.lookup(a.sym, a.mask, key, 0, d.lo);
        return store_.lookup(a.sym, a.mask, key, 0, n);
    }

    // Binds fresh columns of row `r` and checks the columns the index could
    // not: repeated variables and the lattice value.
    bool matches(const compiled_atom &a, row_id r, const value *lattice_value) {
        size_t last = a.cols.size() - 1;
        for (size_t i = 0; i < a.cols.size(); ++i) {
            const column_plan &col = a.cols[i];
            bool value_col = a.lattice && i == last;
            switch (col.mode) {
            case column_mode::bind:
                env_[col.slot] = store_.cell(a.sym, r, i);
                break;
            case column_mode::check:
                if (value_col) {
                    if (!store_.lattice(a.sym).entails(r, env_[col.slot], caller()))
                        return false;
                } else if (!(store_.cell(a.sym, r, i) == env_[col.slot])) {
                    return false;
                }
                break;
            case column_mode::key:
                if (value_col && !store_.lattice(a.sym).entails(r, *lattice_value, caller()))
                    return false;
                break;
            case column_mode::ignore:
                break;
            }
        }
        return true;
    }

    void step(const compiled_atom &a, size_t li) {
        fact key;
        value lattice_value;
        for (size_t i = 0; i < a.cols.size(); ++i) {
            if (a.cols[i].mode != column_mode::key)
                continue;
            value v = eval(a.cols[i].key);
            if (a.lattice && i + 1 == a.cols.size())
                lattice_value = std::move(v);
            else
                key.push_back(std::move(v));
        }

        match_range rows = select(a, li, key);
        if (a.negated) {
            for (row_id r : rows)
                if (matches(a, r, &lattice_value))
                    return;
            join(li + 1);
            return;
        }
        for (row_id r : rows) {
            if (!matches(a, r, &lattice_value))
                continue;
            join(li + 1);
            current_bound_ = current_->bound_before[li];
        }
    }

    void step(const compiled_filter &f, size_t li) {
        std::vector<value> args;
        args.reserve(f.args.size());
        for (const auto &a : f.args)
            args.push_back(eval(a));
        value r = invoke(f.name, *f.fn, args);
        if (r.kind() != value_kind::boolean)
            throw scalar_function_failure(f.name,
                                          "returned " + r.to_literal() +
                                              ", expected a boolean",
                                          context_name(), current_bindings());
        if (r.as_bool())
            join(li + 1);
    }

    void step(const compiled_guard &g, size_t li) {
        if (!(eval(g.lhs) == eval(g.rhs)))
            join(li + 1);
    }

    void step(const compiled_loop &l, size_t li) {
        value coll = eval(l.collection);
        if (!coll.is_collection())
            throw std::invalid_argument("constraint '" + current_->name +
                                        "': loop over non-collection " +
                                        coll.to_literal());
        for (const auto &e : coll.items()) {
            if (l.check) {
                if (!(env_[l.slot] == e))
                    continue;
            } else {
                env_[l.slot] = e;
            }
            join(li + 1);
            current_bound_ = current_->bound_before[li];
        }
    }

    void emit() {
        const compiled_constraint &c = *current_;
        current_bound_ = c.bound_before.back();
        switch (c.kind) {
        case head_kind::pass:
            return;
        case head_kind::fail:
            throw unsatisfiable_constraint(c.name, current_bindings());
        case head_kind::atom: {
            fact f;
            f.reserve(c.head_terms.size());
            for (const auto &t : c.head_terms)
                f.push_back(eval(t));
            pending_.push_back({c.head_sym, std::move(f),
                                static_cast<size_t>(current_ - cs_.data())});
            return;
        }
        }
    }

    void join(size_t li) {
        const compiled_constraint &c = *current_;
        if (li == c.body.size()) {
            emit();
            return;
        }
        current_bound_ = c.bound_before[li];
        std::visit([&](const auto &l) { step(l, li); }, c.body[li]);
    }

    void fire(size_t ci, size_t delta_lit) {
        current_ = &cs_[ci];
        delta_lit_ = delta_lit;
        env_.assign(current_->slot_names.size(), value{});
        join(0);
        current_ = nullptr;
        delta_lit_ = no_delta;
    }

    // Folds the round's derivations into the store; the changes become the
    // next round's deltas.
    bool apply(const stratum_plan &plan) {
        std::vector<row_id> before;
        for (size_t sym : plan.symbols) {
            if (store_.is_lattice(sym))
                store_.lattice(sym).take_changed();
            before.push_back(store_.size(sym));
        }

        auto call = caller();
        for (const auto &pf : pending_) {
            current_ = &cs_[pf.constraint];
            applying_ = &pf;
            if (store_.is_lattice(pf.sym)) {
                fact key(pf.values.begin(), pf.values.end() - 1);
                if (store_.merge(pf.sym, std::move(key), pf.values.back(), call))
                    ++stats_.merged;
            } else if (store_.insert(pf.sym, pf.values)) {
                ++stats_.inserted;
            }
        }
        current_ = nullptr;
        applying_ = nullptr;
        pending_.clear();

        std::vector<size_t> sizes;
        for (size_t sym = 0; sym < p_.symbols().size(); ++sym)
            sizes.push_back(store_.size(sym));
        stats_.extents.push_back(std::move(sizes));

        bool any = false;
        for (size_t i = 0; i < plan.symbols.size(); ++i) {
            size_t sym = plan.symbols[i];
            symbol_delta &d = deltas_[sym];
            if (store_.is_lattice(sym)) {
                d.changed = store_.lattice(sym).take_changed();
            } else {
                d.lo = before[i];
                d.hi = store_.size(sym);
            }
            any = any || !d.empty();
        }
        return any;
    }

    size_t evaluate_stratum(const stratum_plan &plan) {
        size_t rounds = 1;
        for (size_t ci : plan.rules)
            fire(ci, no_delta);
        bool changed = apply(plan);
        while (changed) {
            ++rounds;
            for (size_t ci : plan.rules) {
                for (size_t li : cs_[ci].recursive_atoms) {
                    const auto &a = std::get<compiled_atom>(cs_[ci].body[li]);
                    if (!deltas_[a.sym].empty())
                        fire(ci, li);
                }
            }
            changed = apply(plan);
        }
        for (size_t sym : plan.symbols)
            deltas_[sym] = {};
        return rounds;
    }

    void load(const std::vector<ground_fact> &facts) {
        auto call = caller();
        for (const auto &gf : facts) {
            const symbol *s = p_.find(gf.symbol);
            if (!s)
                throw std::invalid_argument("fact for unknown symbol: " + gf.to_string());
            if (gf.values.size() != s->arity)
                throw std::invalid_argument("fact has wrong arity: " + gf.to_string());
            size_t sym = p_.symbol_id(gf.symbol);
            if (s->is_lattice()) {
                fact key(gf.values.begin(), gf.values.end() - 1);
                store_.merge(sym, std::move(key), gf.values.back(), call);
            } else {
                store_.insert(sym, gf.values);
            }
        }
        for (size_t sym = 0; sym < p_.symbols().size(); ++sym)
            if (store_.is_lattice(sym))
                store_.lattice(sym).take_changed();
    }

  public:
    evaluation(const program &p, const function_table &fns, const schedule &sched,
               const std::vector<compiled_constraint> &cs)
        : p_(p), sched_(sched), cs_(cs), store_(p, fns), deltas_(p.symbols().size()) {}

    model run(const std::vector<ground_fact> &facts) {
        load(facts);
        for (const auto &plan : sched_.strata) {
            STRATALOG_LOG_DEBUG("solver", "stratum {}: {} rules, {} checks",
                                plan.number, plan.rules.size(), plan.checks.size());
            size_t rounds = evaluate_stratum(plan);
            stats_.rounds.push_back(rounds);
            STRATALOG_LOG_DEBUG("solver", "stratum {} reached its fixpoint after {} rounds",
                                plan.number, rounds);
            for (size_t ci : plan.checks)
                fire(ci, no_delta);
        }
        for (size_t ci : sched_.final_checks)
            fire(ci, no_delta);
        return store_.snapshot(p_);
    }

    const solve_stats &stats() const { return stats_; }
};

} // namespace detail

// Evaluates a stratified constraint program to its minimal model. The
// program and function table must outlive the solver. `solve` is const and
// keeps all state local, so one solver may serve concurrent solves.
//
// Termination assumes a finite active domain and lattices of finite height;
// neither is checked.
class solver {
    const program *prog_;
    const function_table *fns_;
    options opts_;
    schedule sched_;
    std::vector<detail::compiled_constraint> compiled_;

  public:
    solver(const program &p, const function_table &fns, const options &opts = {})
        : prog_(&p), fns_(&fns), opts_(opts) {
        if (!fns.frozen())
            throw configuration_error("function table must be frozen before solving");
        for (const auto &s : p.symbols())
            if (s.is_lattice())
                lattice_fns::resolve(s.ops, fns);
        sched_ = make_schedule(p);
        compiled_.reserve(p.constraints().size());
        for (const auto &c : p.constraints())
            compiled_.push_back(detail::constraint_compiler(p, fns, c).compile());
    }

    model solve(const std::vector<ground_fact> &facts,
                solve_stats *stats = nullptr) const {
        detail::evaluation ev(*prog_, *fns_, sched_, compiled_);
        model m = ev.run(facts);
        if (stats)
            *stats = ev.stats();
        STRATALOG_LOG_DEBUG("solver", "solved {} input facts into {} model facts",
                            facts.size(), m.size());
        return m;
    }

    const program &prog() const { return *prog_; }
    const options &opts() const { return opts_; }
    const schedule &plan() const { return sched_; }
};

} // namespace stratalog
