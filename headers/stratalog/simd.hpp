#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace stratalog::simd {

using mask_t = std::vector<uint64_t>;

inline size_t num_words(size_t bits) { return (bits + 63) / 64; }

inline void bandnot(uint64_t *a, const uint64_t *b, size_t n) {
    for (size_t i = 0; i < n; ++i)
        a[i] &= ~b[i];
}

inline void clear_tail(uint64_t *a, size_t nw, size_t nb) {
    if (nb % 64 && nw)
        a[nw - 1] &= (1ULL << (nb % 64)) - 1;
}

inline bool test(const uint64_t *a, size_t i) {
    return a[i / 64] & (1ULL << (i % 64));
}
inline void set(uint64_t *a, size_t i) { a[i / 64] |= (1ULL << (i % 64)); }

inline size_t popcount(const uint64_t *a, size_t n) {
    size_t c = 0;
    for (size_t i = 0; i < n; ++i)
        c += std::popcount(a[i]);
    return c;
}
inline bool any(const uint64_t *a, size_t n) {
    for (size_t i = 0; i < n; ++i)
        if (a[i])
            return true;
    return false;
}

// Grows a mask to cover `bits` entries, zero-filling the new words.
inline void reserve_bits(mask_t &m, size_t bits) {
    size_t w = num_words(bits);
    if (m.size() < w)
        m.resize(w, 0);
}

inline mask_t filled(size_t bits) {
    mask_t m(num_words(bits), ~0ULL);
    clear_tail(m.data(), m.size(), bits);
    return m;
}

// Calls f(i) for every set bit, lowest first.
template <typename F> void for_each_set(const mask_t &m, F &&f) {
    for (size_t w = 0; w < m.size(); ++w) {
        uint64_t word = m[w];
        while (word) {
            size_t b = static_cast<size_t>(std::countr_zero(word));
            f(w * 64 + b);
            word &= word - 1;
        }
    }
}

} // namespace stratalog::simd
