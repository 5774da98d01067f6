#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include "value.hpp"

namespace stratalog {

// Immutable result of a successful solve.
class model {
  public:
    using entry = std::pair<fact, value>;

    struct relation_extent {
        std::vector<std::string> columns;
        std::vector<fact> facts;
    };
    struct lattice_extent {
        std::vector<std::string> columns;
        std::vector<entry> entries;
    };

    model() = default;
    model(std::map<std::string, relation_extent, std::less<>> relations,
          std::map<std::string, lattice_extent, std::less<>> lattices)
        : relations_(std::move(relations)), lattices_(std::move(lattices)) {
        for (auto &[name, r] : relations_)
            std::sort(r.facts.begin(), r.facts.end(), fact_less);
        for (auto &[name, l] : lattices_)
            std::sort(l.entries.begin(), l.entries.end(),
                      [](const entry &a, const entry &b) {
                          return fact_less(a.first, b.first);
                      });
    }

    bool has_relation(std::string_view name) const {
        return relations_.find(name) != relations_.end();
    }
    bool has_lattice(std::string_view name) const {
        return lattices_.find(name) != lattices_.end();
    }

    const std::vector<fact> &relation(std::string_view name) const {
        auto it = relations_.find(name);
        if (it == relations_.end())
            throw std::out_of_range("no relation: " + std::string(name));
        return it->second.facts;
    }

    const std::vector<entry> &lattice(std::string_view name) const {
        auto it = lattices_.find(name);
        if (it == lattices_.end())
            throw std::out_of_range("no lattice: " + std::string(name));
        return it->second.entries;
    }

    std::vector<std::string> relation_names() const {
        std::vector<std::string> out;
        for (const auto &[name, r] : relations_)
            out.push_back(name);
        return out;
    }

    std::vector<std::string> lattice_names() const {
        std::vector<std::string> out;
        for (const auto &[name, l] : lattices_)
            out.push_back(name);
        return out;
    }

    // Flattens the model back into ground facts; lattice entries carry their
    // value as the last column.
    std::vector<ground_fact> facts() const {
        std::vector<ground_fact> out;
        for (const auto &[name, r] : relations_)
            for (const auto &f : r.facts)
                out.push_back({name, f});
        for (const auto &[name, l] : lattices_)
            for (const auto &[key, v] : l.entries) {
                fact f = key;
                f.push_back(v);
                out.push_back({name, std::move(f)});
            }
        return out;
    }

    size_t size() const {
        size_t n = 0;
        for (const auto &[name, r] : relations_)
            n += r.facts.size();
        for (const auto &[name, l] : lattices_)
            n += l.entries.size();
        return n;
    }

    // Renders one table as an ASCII grid.
    void print(std::string_view name, std::ostream &os) const {
        if (auto it = relations_.find(name); it != relations_.end()) {
            std::vector<std::vector<std::string>> rows;
            for (const auto &f : it->second.facts)
                rows.push_back(cells(f));
            print_grid(os, name, it->second.columns, rows);
            return;
        }
        if (auto it = lattices_.find(name); it != lattices_.end()) {
            std::vector<std::vector<std::string>> rows;
            for (const auto &[key, v] : it->second.entries) {
                auto row = cells(key);
                row.push_back(v.to_literal());
                rows.push_back(std::move(row));
            }
            print_grid(os, name, it->second.columns, rows);
            return;
        }
        fmt::print(os, "No such name: {}\n", name);
    }

    bool operator==(const model &o) const {
        return facts() == o.facts();
    }

  private:
    std::map<std::string, relation_extent, std::less<>> relations_;
    std::map<std::string, lattice_extent, std::less<>> lattices_;

    static std::vector<std::string> cells(const fact &f) {
        std::vector<std::string> out;
        for (const auto &v : f)
            out.push_back(v.to_literal());
        return out;
    }

    static void print_grid(std::ostream &os, std::string_view name,
                           const std::vector<std::string> &columns,
                           const std::vector<std::vector<std::string>> &rows) {
        std::vector<size_t> width(columns.size());
        for (size_t c = 0; c < columns.size(); ++c)
            width[c] = columns[c].size();
        for (const auto &row : rows)
            for (size_t c = 0; c < row.size() && c < width.size(); ++c)
                width[c] = std::max(width[c], row[c].size());

        std::string rule = "+";
        for (size_t w : width)
            rule += std::string(w + 2, '-') + "+";

        auto line = [&](const std::vector<std::string> &cols) {
            std::string out = "|";
            for (size_t c = 0; c < width.size(); ++c)
                out += fmt::format(" {:<{}} |", c < cols.size() ? cols[c] : "",
                                   width[c]);
            fmt::print(os, "{}\n", out);
        };

        fmt::print(os, "{}\n{}\n", name, rule);
        line(columns);
        fmt::print(os, "{}\n", rule);
        for (const auto &row : rows)
            line(row);
        fmt::print(os, "{}\n\n", rule);
    }
};

} // namespace stratalog
