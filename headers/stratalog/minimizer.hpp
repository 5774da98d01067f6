#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "simd.hpp"
#include "solver.hpp"
#include "value.hpp"

namespace stratalog {

enum class minimize_status { minimized, not_reproducible };

struct minimize_result {
    minimize_status status = minimize_status::not_reproducible;
    std::vector<ground_fact> facts;
    failure_kind original_kind = failure_kind::none;
    std::string original_message;
    size_t trials = 0;
};

// Shrinks a failing fact set to a 1-minimal subset that still fails, by
// delta debugging over full solves. Every trial is a fresh solve.
class delta_minimizer {
    const solver &solver_;
    strictness strictness_;

    struct outcome {
        failure_kind kind = failure_kind::none;
        std::string message;

        bool failed() const { return kind != failure_kind::none; }
    };

    // Only evaluation failures count as outcomes; anything else propagates.
    outcome trial(const std::vector<ground_fact> &facts, minimize_result &r) const {
        ++r.trials;
        try {
            solver_.solve(facts);
        } catch (const evaluation_error &e) {
            STRATALOG_LOG_DEBUG("minimizer", "trial {} over {} facts failed: {}",
                                r.trials, facts.size(), e.what());
            return {kind_of(e), e.what()};
        }
        STRATALOG_LOG_DEBUG("minimizer", "trial {} over {} facts passed", r.trials,
                            facts.size());
        return {};
    }

    bool reproduces(const outcome &o, const minimize_result &r) const {
        if (!o.failed())
            return false;
        switch (strictness_) {
        case strictness::any_failure:
            return true;
        case strictness::same_kind:
            return o.kind == r.original_kind;
        case strictness::same_message:
            return o.kind == r.original_kind && o.message == r.original_message;
        }
        return false;
    }

    static std::vector<ground_fact> subset(const std::vector<ground_fact> &all,
                                           const simd::mask_t &m) {
        std::vector<ground_fact> out;
        simd::for_each_set(m, [&](size_t i) { out.push_back(all[i]); });
        return out;
    }

    // Splits the set bits of `m` into `n` chunks in index order; the first
    // size % n chunks get one extra element.
    static std::vector<simd::mask_t> partition(const simd::mask_t &m, size_t size,
                                               size_t n) {
        std::vector<simd::mask_t> chunks(n, simd::mask_t(m.size(), 0));
        size_t base = size / n, extra = size % n;
        size_t chunk = 0, taken = 0;
        simd::for_each_set(m, [&](size_t i) {
            if (taken == base + (chunk < extra ? 1 : 0)) {
                ++chunk;
                taken = 0;
            }
            simd::set(chunks[chunk].data(), i);
            ++taken;
        });
        return chunks;
    }

    simd::mask_t ddmin(const std::vector<ground_fact> &facts, minimize_result &r) const {
        simd::mask_t cand = simd::filled(facts.size());
        size_t n = 2;
        for (;;) {
            size_t size = simd::popcount(cand.data(), cand.size());
            if (size < 2)
                return cand;
            n = std::min(n, size);

            bool reduced = false;
            auto chunks = partition(cand, size, n);
            for (const auto &chunk : chunks) {
                simd::mask_t rest = cand;
                simd::bandnot(rest.data(), chunk.data(), rest.size());
                if (reproduces(trial(subset(facts, rest), r), r)) {
                    cand = std::move(rest);
                    reduced = true;
                    break;
                }
                // With two chunks each complement is the other chunk.
                if (n > 2 && reproduces(trial(subset(facts, chunk), r), r)) {
                    cand = chunk;
                    reduced = true;
                    break;
                }
            }
            if (reduced) {
                n = 2;
                continue;
            }
            if (n >= size)
                return cand;
            n = std::min(n * 2, size);
        }
    }

  public:
    explicit delta_minimizer(const solver &s)
        : solver_(s), strictness_(s.opts().minimize_strictness) {}
    delta_minimizer(const solver &s, strictness level) : solver_(s), strictness_(level) {}

    strictness level() const { return strictness_; }

    // Writes nothing; see the sink overloads.
    minimize_result minimize(const std::vector<ground_fact> &facts) const {
        minimize_result r;
        outcome original = trial(facts, r);
        if (!original.failed()) {
            STRATALOG_LOG_INFO("minimizer", "{} facts do not reproduce a failure",
                               facts.size());
            return r;
        }
        r.original_kind = original.kind;
        r.original_message = original.message;

        simd::mask_t cand;
        if (reproduces(trial({}, r), r))
            cand = simd::mask_t(simd::num_words(facts.size()), 0);
        else
            cand = ddmin(facts, r);
        r.facts = subset(facts, cand);

        if (!reproduces(trial(r.facts, r), r))
            throw reproduction_failure(fmt::format(
                "minimized set of {} facts no longer reproduces: {}", r.facts.size(),
                r.original_message));
        r.status = minimize_status::minimized;
        STRATALOG_LOG_INFO("minimizer", "minimized {} facts to {} in {} trials",
                           facts.size(), r.facts.size(), r.trials);
        return r;
    }

    // One fact per line, in literal syntax.
    minimize_result minimize(const std::vector<ground_fact> &facts,
                             std::ostream &sink) const {
        minimize_result r = minimize(facts);
        if (r.status == minimize_status::minimized)
            write(r.facts, sink);
        return r;
    }

    minimize_result minimize(const std::vector<ground_fact> &facts,
                             const std::filesystem::path &sink) const {
        minimize_result r = minimize(facts);
        if (r.status != minimize_status::minimized)
            return r;
        std::ofstream out(sink, std::ios::out | std::ios::trunc);
        if (!out)
            throw error("cannot open '" + sink.string() + "' for writing");
        write(r.facts, out);
        if (!out.flush())
            throw error("failed writing '" + sink.string() + "'");
        return r;
    }

    static void write(const std::vector<ground_fact> &facts, std::ostream &os) {
        for (const auto &f : facts)
            fmt::print(os, "{}\n", f);
    }
};

} // namespace stratalog
