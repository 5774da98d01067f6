#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "functions.hpp"
#include "model.hpp"
#include "program.hpp"
#include "simd.hpp"
#include "value.hpp"

namespace stratalog {

using row_id = uint32_t;
using column_mask = uint64_t;

inline column_mask column_bit(size_t col) { return 1ULL << col; }

inline fact project(const fact &f, column_mask m) {
    fact key;
    for (size_t c = 0; c < f.size(); ++c)
        if (m & column_bit(c))
            key.push_back(f[c]);
    return key;
}

// Rows of one table matching a lookup: either a dense row range or the
// ascending row ids of one index bucket, clipped to [lo, hi) and optionally
// restricted to the rows set in `only`.
class match_range {
    const row_id *ids_ = nullptr;
    size_t first_ = 0, last_ = 0;
    const simd::mask_t *only_ = nullptr;

  public:
    match_range() = default;
    match_range(row_id lo, row_id hi, const simd::mask_t *only)
        : first_(lo), last_(std::max(lo, hi)), only_(only) {}
    match_range(std::span<const row_id> bucket, row_id lo, row_id hi,
                const simd::mask_t *only)
        : ids_(bucket.data()), only_(only) {
        first_ = static_cast<size_t>(
            std::lower_bound(bucket.begin(), bucket.end(), lo) - bucket.begin());
        last_ = static_cast<size_t>(
            std::lower_bound(bucket.begin(), bucket.end(), hi) - bucket.begin());
        last_ = std::max(first_, last_);
    }

    class iterator {
        const match_range *r_;
        size_t pos_;

        void skip() {
            while (pos_ < r_->last_ && r_->only_ && !r_->admits(r_->at(pos_)))
                ++pos_;
        }

      public:
        iterator(const match_range *r, size_t pos) : r_(r), pos_(pos) { skip(); }
        row_id operator*() const { return r_->at(pos_); }
        iterator &operator++() {
            ++pos_;
            skip();
            return *this;
        }
        bool operator!=(const iterator &o) const { return pos_ != o.pos_; }
    };

    iterator begin() const { return {this, first_}; }
    iterator end() const { return {this, last_}; }
    bool empty() const { return !(begin() != end()); }

  private:
    row_id at(size_t pos) const {
        return ids_ ? ids_[pos] : static_cast<row_id>(pos);
    }
    bool admits(row_id r) const {
        return r / 64 < only_->size() && simd::test(only_->data(), r);
    }
};

// Hash index over one bound-column pattern. Extended as rows are appended,
// never rebuilt.
struct column_index {
    column_mask columns = 0;
    std::unordered_map<fact, std::vector<row_id>, fact_hash> buckets;
    row_id indexed_upto = 0;

    template <typename RowKey> void extend(row_id upto, RowKey &&key_of) {
        for (row_id r = indexed_upto; r < upto; ++r)
            buckets[project(key_of(r), columns)].push_back(r);
        indexed_upto = upto;
    }

    std::span<const row_id> find(const fact &key) const {
        auto it = buckets.find(key);
        if (it == buckets.end())
            return {};
        return it->second;
    }
};

// Set-valued table; insert-only.
class relation_table {
    size_t arity_;
    std::vector<fact> rows_;
    std::unordered_map<fact, row_id, fact_hash> members_;
    std::map<column_mask, column_index> indexes_;
    uint64_t version_ = 0;

  public:
    explicit relation_table(size_t arity) : arity_(arity) {}

    size_t arity() const { return arity_; }
    row_id size() const { return static_cast<row_id>(rows_.size()); }
    uint64_t version() const { return version_; }
    const fact &row(row_id r) const { return rows_[r]; }
    const value &cell(row_id r, size_t col) const { return rows_[r][col]; }

    bool contains(const fact &f) const { return members_.count(f) != 0; }

    bool insert(fact f) {
        if (f.size() != arity_)
            throw std::invalid_argument("fact arity " + std::to_string(f.size()) +
                                        " does not match relation arity " +
                                        std::to_string(arity_));
        if (members_.count(f))
            return false;
        row_id r = size();
        members_.emplace(f, r);
        rows_.push_back(std::move(f));
        ++version_;
        for (auto &[m, idx] : indexes_)
            idx.extend(size(), [this](row_id i) -> const fact & { return rows_[i]; });
        return true;
    }

    // `key` holds the values of the columns in `m`, in column order.
    match_range lookup(column_mask m, const fact &key, row_id lo, row_id hi,
                       const simd::mask_t *only = nullptr) {
        hi = std::min(hi, size());
        if (m == 0)
            return {lo, hi, only};
        auto [it, fresh] = indexes_.try_emplace(m);
        if (fresh)
            it->second.columns = m;
        it->second.extend(size(), [this](row_id i) -> const fact & { return rows_[i]; });
        return {it->second.find(key), lo, hi, only};
    }

    size_t index_count() const { return indexes_.size(); }
};

// Default invoker for lattice operators.
struct direct_call {
    value operator()(const std::string &, const scalar_fn &fn,
                     std::span<const value> args) const {
        return fn(args);
    }
};

// Resolved lattice operators.
struct lattice_fns {
    value bottom;
    std::string leq_name, lub_name, glb_name;
    const scalar_fn *leq = nullptr;
    const scalar_fn *lub = nullptr;
    const scalar_fn *glb = nullptr;

    static lattice_fns resolve(const lattice_ops &ops, const function_table &fns) {
        return {ops.bottom,     ops.leq,          ops.lub,         ops.glb,
                &fns.get(ops.leq), &fns.get(ops.lub), &fns.get(ops.glb)};
    }

    template <typename Call>
    bool is_leq(const value &a, const value &b, Call &&call) const {
        value args[] = {a, b};
        value r = call(leq_name, *leq, args);
        if (r.kind() != value_kind::boolean)
            throw std::invalid_argument("'" + leq_name + "' returned " +
                                        r.to_literal() + ", expected a boolean");
        return r.as_bool();
    }
    template <typename Call>
    value join(const value &a, const value &b, Call &&call) const {
        value args[] = {a, b};
        return call(lub_name, *lub, args);
    }
    template <typename Call>
    value meet(const value &a, const value &b, Call &&call) const {
        value args[] = {a, b};
        return call(glb_name, *glb, args);
    }
};

// One value per key, merged with `lub`; values only move up under `leq`.
// A merge changes the table unless the joined value is leq-equal to the old one.
class lattice_table {
    size_t arity_;
    lattice_fns fns_;
    std::vector<fact> keys_;
    std::vector<value> values_;
    std::unordered_map<fact, row_id, fact_hash> key_rows_;
    std::map<column_mask, column_index> indexes_;
    simd::mask_t changed_;
    uint64_t version_ = 0;

  public:
    lattice_table(size_t arity, lattice_fns fns)
        : arity_(arity), fns_(std::move(fns)) {}

    size_t arity() const { return arity_; }
    size_t key_arity() const { return arity_ - 1; }
    row_id size() const { return static_cast<row_id>(keys_.size()); }
    uint64_t version() const { return version_; }
    const lattice_fns &fns() const { return fns_; }
    const fact &key(row_id r) const { return keys_[r]; }
    const value &value_at(row_id r) const { return values_[r]; }
    const value &cell(row_id r, size_t col) const {
        return col < key_arity() ? keys_[r][col] : values_[r];
    }

    const value *find(const fact &key) const {
        auto it = key_rows_.find(key);
        return it != key_rows_.end() ? &values_[it->second] : nullptr;
    }

    template <typename Call = direct_call>
    bool merge(fact key, const value &v, Call &&call = {}) {
        if (key.size() != key_arity())
            throw std::invalid_argument("lattice key arity " +
                                        std::to_string(key.size()) +
                                        " does not match " +
                                        std::to_string(key_arity()));
        auto it = key_rows_.find(key);
        const value &old = it != key_rows_.end() ? values_[it->second] : fns_.bottom;
        value next = fns_.join(old, v, call);
        if (fns_.is_leq(next, old, call) && fns_.is_leq(old, next, call))
            return false;

        row_id r;
        if (it != key_rows_.end()) {
            r = it->second;
            values_[r] = std::move(next);
        } else {
            r = size();
            key_rows_.emplace(key, r);
            keys_.push_back(std::move(key));
            values_.push_back(std::move(next));
            for (auto &[m, idx] : indexes_)
                idx.extend(size(), [this](row_id i) -> const fact & { return keys_[i]; });
        }
        simd::reserve_bits(changed_, size());
        simd::set(changed_.data(), r);
        ++version_;
        return true;
    }

    // True when the stored value at `r` covers `v`: glb(v, stored) is above
    // bottom.
    template <typename Call = direct_call>
    bool entails(row_id r, const value &v, Call &&call = {}) const {
        value m = fns_.meet(v, values_[r], call);
        return !fns_.is_leq(m, fns_.bottom, call);
    }

    // Rows whose value changed since the previous call.
    simd::mask_t take_changed() {
        simd::mask_t out;
        std::swap(out, changed_);
        return out;
    }

    // `m` may only name key columns.
    match_range lookup(column_mask m, const fact &key, row_id lo, row_id hi,
                       const simd::mask_t *only = nullptr) {
        hi = std::min(hi, size());
        if (m == 0)
            return {lo, hi, only};
        auto [it, fresh] = indexes_.try_emplace(m);
        if (fresh)
            it->second.columns = m;
        it->second.extend(size(), [this](row_id i) -> const fact & { return keys_[i]; });
        return {it->second.find(key), lo, hi, only};
    }

    size_t index_count() const { return indexes_.size(); }
};

// Current extent of every symbol of one program, indexed by symbol id.
class table_store {
    std::vector<std::variant<relation_table, lattice_table>> tables_;

  public:
    table_store(const program &p, const function_table &fns) {
        tables_.reserve(p.symbols().size());
        for (const auto &s : p.symbols()) {
            if (s.is_lattice())
                tables_.emplace_back(std::in_place_type<lattice_table>, s.arity,
                                     lattice_fns::resolve(s.ops, fns));
            else
                tables_.emplace_back(std::in_place_type<relation_table>, s.arity);
        }
    }

    bool is_lattice(size_t sym) const {
        return std::holds_alternative<lattice_table>(tables_.at(sym));
    }

    relation_table &relation(size_t sym) { return std::get<relation_table>(tables_.at(sym)); }
    const relation_table &relation(size_t sym) const {
        return std::get<relation_table>(tables_.at(sym));
    }
    lattice_table &lattice(size_t sym) { return std::get<lattice_table>(tables_.at(sym)); }
    const lattice_table &lattice(size_t sym) const {
        return std::get<lattice_table>(tables_.at(sym));
    }

    bool insert(size_t sym, fact f) { return relation(sym).insert(std::move(f)); }

    template <typename Call = direct_call>
    bool merge(size_t sym, fact key, const value &v, Call &&call = {}) {
        return lattice(sym).merge(std::move(key), v, call);
    }

    row_id size(size_t sym) const {
        return std::visit([](const auto &t) { return t.size(); }, tables_.at(sym));
    }

    const value &cell(size_t sym, row_id r, size_t col) const {
        return std::visit([&](const auto &t) -> const value & { return t.cell(r, col); },
                          tables_.at(sym));
    }

    match_range lookup(size_t sym, column_mask m, const fact &key, row_id lo,
                       row_id hi, const simd::mask_t *only = nullptr) {
        return std::visit([&](auto &t) { return t.lookup(m, key, lo, hi, only); },
                          tables_.at(sym));
    }

    model snapshot(const program &p) const {
        std::map<std::string, model::relation_extent, std::less<>> relations;
        std::map<std::string, model::lattice_extent, std::less<>> lattices;
        for (size_t i = 0; i < tables_.size(); ++i) {
            const symbol &s = p.get(i);
            std::vector<std::string> columns;
            for (size_t c = 0; c < s.arity; ++c)
                columns.push_back(s.attribute(c));
            if (const auto *r = std::get_if<relation_table>(&tables_[i])) {
                model::relation_extent ext{std::move(columns), {}};
                for (row_id row = 0; row < r->size(); ++row)
                    ext.facts.push_back(r->row(row));
                relations.emplace(s.name, std::move(ext));
            } else {
                const auto &l = std::get<lattice_table>(tables_[i]);
                model::lattice_extent ext{std::move(columns), {}};
                for (row_id row = 0; row < l.size(); ++row)
                    ext.entries.emplace_back(l.key(row), l.value_at(row));
                lattices.emplace(s.name, std::move(ext));
            }
        }
        return model(std::move(relations), std::move(lattices));
    }
};

} // namespace stratalog
