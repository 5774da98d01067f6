#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

namespace stratalog {

enum class value_kind : uint8_t {
    unit,
    boolean,
    character,
    int8,
    int16,
    int32,
    int64,
    float32,
    float64,
    str,
    tag,
    tuple,
    set,
    list,
};

struct unit_t {
    bool operator==(const unit_t &) const = default;
};

struct tag_data;
struct tuple_data;
struct set_data;
struct list_data;

// Runtime value handed over by the embedding layer. Composite payloads are
// immutable and shared, so copies are cheap.
class value {
  public:
    using data_t =
        std::variant<unit_t, bool, char, int8_t, int16_t, int32_t, int64_t,
                     float, double, std::string, std::shared_ptr<const tag_data>,
                     std::shared_ptr<const tuple_data>,
                     std::shared_ptr<const set_data>,
                     std::shared_ptr<const list_data>>;

    value() = default;

    static value unit() { return value(unit_t{}); }
    static value boolean(bool b) { return value(b); }
    static value character(char c) { return value(c); }
    static value int8(int8_t i) { return value(i); }
    static value int16(int16_t i) { return value(i); }
    static value int32(int32_t i) { return value(i); }
    static value int64(int64_t i) { return value(i); }
    static value float32(float f) { return value(f); }
    static value float64(double d) { return value(d); }
    static value str(std::string s) { return value(std::move(s)); }
    static value tag(std::string name, value payload = unit());
    static value tuple(std::vector<value> items);
    static value set(std::vector<value> items);
    static value list(std::vector<value> items);

    value_kind kind() const { return static_cast<value_kind>(data_.index()); }
    const data_t &data() const { return data_; }

    template <typename T> const T &get() const { return std::get<T>(data_); }

    bool as_bool() const { return get<bool>(); }
    int32_t as_int32() const { return get<int32_t>(); }
    int64_t as_int64() const { return get<int64_t>(); }
    double as_float64() const { return get<double>(); }
    const std::string &as_str() const { return get<std::string>(); }

    const std::string &tag_name() const;
    const value &payload() const;

    bool is_collection() const {
        auto k = kind();
        return k == value_kind::set || k == value_kind::list;
    }
    // Elements of a tuple, set or list.
    const std::vector<value> &items() const;

    size_t hash() const;
    std::string to_literal() const;

  private:
    template <typename T>
        requires(!std::is_same_v<T, value>)
    explicit value(T v) : data_(std::in_place_type<T>, std::move(v)) {}

    data_t data_;
};

struct tag_data {
    std::string name;
    value payload;
};
struct tuple_data {
    std::vector<value> items;
};
struct set_data {
    std::vector<value> items;
};
struct list_data {
    std::vector<value> items;
};

inline int compare(const value &a, const value &b);

inline bool operator==(const value &a, const value &b) {
    return compare(a, b) == 0;
}
inline bool operator<(const value &a, const value &b) {
    return compare(a, b) < 0;
}

using fact = std::vector<value>;

inline size_t hash_combine(size_t seed, size_t h) {
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

struct value_hash {
    size_t operator()(const value &v) const { return v.hash(); }
};

struct fact_hash {
    size_t operator()(const fact &f) const {
        size_t h = f.size();
        for (const auto &v : f)
            h = hash_combine(h, v.hash());
        return h;
    }
};

inline bool fact_less(const fact &a, const fact &b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

inline std::string fact_to_string(const fact &f);

// A fact addressed to a named symbol: the unit of solver input and of
// minimizer output.
struct ground_fact {
    std::string symbol;
    fact values;

    std::string to_string() const {
        return symbol + "(" + fact_to_string(values) + ")";
    }
    bool operator==(const ground_fact &o) const {
        return symbol == o.symbol && values == o.values;
    }
};

namespace detail {

template <typename T> int three_way(const T &a, const T &b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

template <typename F> int compare_float(F a, F b) {
    bool na = std::isnan(a), nb = std::isnan(b);
    if (na || nb)
        return na == nb ? 0 : (na ? 1 : -1);
    return three_way(a, b);
}

inline int compare_items(const std::vector<value> &a,
                         const std::vector<value> &b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i)
        if (int c = compare(a[i], b[i]))
            return c;
    return three_way(a.size(), b.size());
}

inline void escape_into(std::string &out, char c, char quote) {
    switch (c) {
    case '\n': out += "\\n"; break;
    case '\t': out += "\\t"; break;
    case '\r': out += "\\r"; break;
    case '\\': out += "\\\\"; break;
    default:
        if (c == quote)
            out += '\\';
        out += c;
    }
}

template <typename F> std::string float_literal(F f) {
    std::string s = fmt::format("{}", f);
    if (s.find_first_of(".eEna") == std::string::npos)
        s += ".0";
    return s;
}

inline std::string join_literals(const std::vector<value> &items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i)
            out += ", ";
        out += items[i].to_literal();
    }
    return out;
}

} // namespace detail

inline value value::tag(std::string name, value payload) {
    std::shared_ptr<const tag_data> p =
        std::make_shared<tag_data>(tag_data{std::move(name), std::move(payload)});
    return value(std::move(p));
}

inline value value::tuple(std::vector<value> items) {
    std::shared_ptr<const tuple_data> p =
        std::make_shared<tuple_data>(tuple_data{std::move(items)});
    return value(std::move(p));
}

inline value value::set(std::vector<value> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    std::shared_ptr<const set_data> p =
        std::make_shared<set_data>(set_data{std::move(items)});
    return value(std::move(p));
}

inline value value::list(std::vector<value> items) {
    std::shared_ptr<const list_data> p =
        std::make_shared<list_data>(list_data{std::move(items)});
    return value(std::move(p));
}

inline const std::string &value::tag_name() const {
    return get<std::shared_ptr<const tag_data>>()->name;
}

inline const value &value::payload() const {
    return get<std::shared_ptr<const tag_data>>()->payload;
}

inline const std::vector<value> &value::items() const {
    switch (kind()) {
    case value_kind::tuple: return get<std::shared_ptr<const tuple_data>>()->items;
    case value_kind::set: return get<std::shared_ptr<const set_data>>()->items;
    case value_kind::list: return get<std::shared_ptr<const list_data>>()->items;
    default: throw std::bad_variant_access();
    }
}

inline int compare(const value &a, const value &b) {
    if (a.kind() != b.kind())
        return detail::three_way(a.kind(), b.kind());
    return std::visit(
        [&](const auto &x) -> int {
            using T = std::decay_t<decltype(x)>;
            const T &y = std::get<T>(b.data());
            if constexpr (std::is_same_v<T, unit_t>)
                return 0;
            else if constexpr (std::is_floating_point_v<T>)
                return detail::compare_float(x, y);
            else if constexpr (std::is_same_v<T, std::shared_ptr<const tag_data>>) {
                if (int c = detail::three_way(x->name, y->name))
                    return c;
                return compare(x->payload, y->payload);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const tuple_data>> ||
                                 std::is_same_v<T, std::shared_ptr<const set_data>> ||
                                 std::is_same_v<T, std::shared_ptr<const list_data>>)
                return x == y ? 0 : detail::compare_items(x->items, y->items);
            else
                return detail::three_way(x, y);
        },
        a.data());
}

inline size_t value::hash() const {
    size_t seed = static_cast<size_t>(kind());
    size_t h = std::visit(
        [](const auto &x) -> size_t {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, unit_t>)
                return 0;
            else if constexpr (std::is_floating_point_v<T>)
                return std::isnan(x) ? 0x7ff8 : std::hash<T>{}(x);
            else if constexpr (std::is_same_v<T, std::shared_ptr<const tag_data>>)
                return hash_combine(std::hash<std::string>{}(x->name), x->payload.hash());
            else if constexpr (std::is_same_v<T, std::shared_ptr<const tuple_data>> ||
                               std::is_same_v<T, std::shared_ptr<const set_data>> ||
                               std::is_same_v<T, std::shared_ptr<const list_data>>) {
                size_t s = x->items.size();
                for (const auto &v : x->items)
                    s = hash_combine(s, v.hash());
                return s;
            } else
                return std::hash<T>{}(x);
        },
        data_);
    return hash_combine(seed, h);
}

inline std::string value::to_literal() const {
    return std::visit(
        [](const auto &x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, unit_t>)
                return "()";
            else if constexpr (std::is_same_v<T, bool>)
                return x ? "true" : "false";
            else if constexpr (std::is_same_v<T, char>) {
                std::string out = "'";
                detail::escape_into(out, x, '\'');
                return out + "'";
            } else if constexpr (std::is_same_v<T, int8_t>)
                return fmt::format("{}i8", static_cast<int>(x));
            else if constexpr (std::is_same_v<T, int16_t>)
                return fmt::format("{}i16", x);
            else if constexpr (std::is_same_v<T, int32_t>)
                return fmt::format("{}", x);
            else if constexpr (std::is_same_v<T, int64_t>)
                return fmt::format("{}i64", x);
            else if constexpr (std::is_same_v<T, float>)
                return detail::float_literal(x) + "f32";
            else if constexpr (std::is_same_v<T, double>)
                return detail::float_literal(x);
            else if constexpr (std::is_same_v<T, std::string>) {
                std::string out = "\"";
                for (char c : x)
                    detail::escape_into(out, c, '"');
                return out + "\"";
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const tag_data>>) {
                const value &p = x->payload;
                if (p.kind() == value_kind::unit)
                    return x->name;
                if (p.kind() == value_kind::tuple)
                    return x->name + p.to_literal();
                return x->name + "(" + p.to_literal() + ")";
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const tuple_data>>)
                return "(" + detail::join_literals(x->items) + ")";
            else if constexpr (std::is_same_v<T, std::shared_ptr<const set_data>>)
                return "#{" + detail::join_literals(x->items) + "}";
            else
                return "[" + detail::join_literals(x->items) + "]";
        },
        data_);
}

inline std::string fact_to_string(const fact &f) {
    return detail::join_literals(f);
}

} // namespace stratalog

template <> struct fmt::formatter<stratalog::value> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const stratalog::value &v, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(v.to_literal(), ctx);
    }
};

template <> struct fmt::formatter<stratalog::ground_fact> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const stratalog::ground_fact &f, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(f.to_string(), ctx);
    }
};
