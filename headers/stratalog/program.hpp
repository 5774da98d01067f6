#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "value.hpp"

namespace stratalog {

enum class symbol_kind { relation, lattice };

// Names of the scalar functions implementing a lattice's operators; they
// apply to the last attribute only.
struct lattice_ops {
    value bottom;
    std::string leq;
    std::string lub;
    std::string glb;
};

inline constexpr size_t max_arity = 64;

struct symbol {
    std::string name;
    size_t arity = 0;
    symbol_kind kind = symbol_kind::relation;
    int stratum = 0;
    std::vector<std::string> attributes;
    lattice_ops ops;

    bool is_lattice() const { return kind == symbol_kind::lattice; }
    std::string attribute(size_t i) const {
        return i < attributes.size() ? attributes[i] : "c" + std::to_string(i);
    }
};

// Terms

struct term;

struct variable {
    std::string name;
};
struct constant {
    value val;
};
struct apply {
    std::string function;
    std::vector<term> args;
};

struct term {
    std::variant<variable, constant, apply> node;
};

inline term var(std::string name) { return {variable{std::move(name)}}; }
inline term lit(value v) { return {constant{std::move(v)}}; }
inline term call(std::string function, std::vector<term> args) {
    return {apply{std::move(function), std::move(args)}};
}

// Body literals

struct positive_atom {
    std::string symbol;
    std::vector<term> terms;
};
struct negative_atom {
    std::string symbol;
    std::vector<term> terms;
};
struct filter_call {
    std::string function;
    std::vector<term> args;
};
struct inequality {
    term lhs;
    term rhs;
};
// Binds `variable` to each element of a set- or list-valued term in turn.
struct loop_literal {
    std::string variable;
    term collection;
};

using literal = std::variant<positive_atom, negative_atom, filter_call,
                             inequality, loop_literal>;

// Heads

struct atom_head {
    std::string symbol;
    std::vector<term> terms;
};
struct true_head {};
struct false_head {};

using head = std::variant<atom_head, true_head, false_head>;

struct constraint {
    std::string name;
    head hd;
    std::vector<literal> body;

    bool is_check() const { return !std::holds_alternative<atom_head>(hd); }
};

// A compiled constraint program: stratified symbols plus the constraints
// over them, in program order.
class program {
    std::vector<symbol> symbols_;
    std::unordered_map<std::string, size_t> symbol_index_;
    std::vector<constraint> constraints_;

    size_t add_symbol(symbol s) {
        if (s.arity == 0 || s.arity > max_arity)
            throw std::invalid_argument("symbol '" + s.name +
                                        "' has unsupported arity " +
                                        std::to_string(s.arity));
        if (symbol_index_.count(s.name))
            throw std::invalid_argument("symbol '" + s.name +
                                        "' is already declared");
        size_t id = symbols_.size();
        symbol_index_.emplace(s.name, id);
        symbols_.push_back(std::move(s));
        return id;
    }

  public:
    size_t add_relation(std::string name, size_t arity, int stratum = 0,
                        std::vector<std::string> attributes = {}) {
        symbol s;
        s.name = std::move(name);
        s.arity = arity;
        s.stratum = stratum;
        s.attributes = std::move(attributes);
        return add_symbol(std::move(s));
    }

    size_t add_lattice(std::string name, size_t arity, lattice_ops ops,
                       int stratum = 0,
                       std::vector<std::string> attributes = {}) {
        symbol s;
        s.name = std::move(name);
        s.arity = arity;
        s.kind = symbol_kind::lattice;
        s.stratum = stratum;
        s.attributes = std::move(attributes);
        s.ops = std::move(ops);
        return add_symbol(std::move(s));
    }

    void add_constraint(constraint c) { constraints_.push_back(std::move(c)); }

    const symbol *find(std::string_view name) const {
        auto it = symbol_index_.find(std::string(name));
        return it != symbol_index_.end() ? &symbols_[it->second] : nullptr;
    }

    size_t symbol_id(std::string_view name) const {
        auto it = symbol_index_.find(std::string(name));
        if (it == symbol_index_.end())
            throw std::out_of_range("unknown symbol '" + std::string(name) + "'");
        return it->second;
    }

    const symbol &get(size_t id) const { return symbols_.at(id); }
    const std::vector<symbol> &symbols() const { return symbols_; }
    const std::vector<constraint> &constraints() const { return constraints_; }
};

} // namespace stratalog
