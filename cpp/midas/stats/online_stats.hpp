// ============================================================================
// Stats: Online score statistics (Welford mean/var + min/max + top-k)
// File: cpp/midas/stats/online_stats.hpp
// ============================================================================
//
// Purpose:
// - Single-pass summary of a score stream for the CLI "summary" command and
//   for the end-of-run log line of the score pipeline.
// - Deterministic behavior with NaN filtering.
// - TopK keeps the highest-scoring records (ties: earlier index wins), which
//   is what an operator looks at first when triaging a stream.
//
// ============================================================================

#pragma once

#include "midas/core/settings.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace midas::stats {

inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// OnlineStats (Welford)
// -----------------------------
struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double M2 = 0.0; // sum of squares of differences from the current mean
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();
    double sum = 0.0;

    void reset() noexcept {
        *this = OnlineStats{};
    }

    void push(double x) noexcept {
        if (!is_finite(x)) return;

        ++n;
        sum += x;

        if (x < min_v) min_v = x;
        if (x > max_v) max_v = x;

        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        const double delta2 = x - mean;
        M2 += delta * delta2;

        if (!is_finite(M2) || M2 < 0.0) M2 = 0.0;
    }

    std::uint64_t count() const noexcept { return n; }

    double variance_population() const noexcept {
        if (n == 0) return 0.0;
        return M2 / static_cast<double>(n);
    }

    double variance_sample() const noexcept {
        if (n < 2) return 0.0;
        return M2 / static_cast<double>(n - 1);
    }

    double stddev_population() const noexcept { return std::sqrt(variance_population()); }
    double stddev_sample() const noexcept { return std::sqrt(variance_sample()); }

    double min() const noexcept { return n == 0 ? 0.0 : min_v; }
    double max() const noexcept { return n == 0 ? 0.0 : max_v; }
};

// -----------------------------
// TopK (bounded, highest scores)
// -----------------------------
struct ScoredIndex final {
    std::size_t index = 0;
    double score = 0.0;
};

class TopK final {
public:
    explicit TopK(std::size_t k = 10) : k_(k) { items_.reserve(k); }

    void push(std::size_t index, double score) {
        if (k_ == 0 || !is_finite(score)) return;
        if (items_.size() == k_ && !(score > items_.back().score)) return;

        ScoredIndex s{index, score};
        auto it = std::upper_bound(items_.begin(), items_.end(), s,
                                   [](const ScoredIndex& a, const ScoredIndex& b) { return a.score > b.score; });
        items_.insert(it, s);
        if (items_.size() > k_) items_.pop_back();
    }

    // Sorted by descending score.
    const std::vector<ScoredIndex>& items() const noexcept { return items_; }
    std::size_t capacity() const noexcept { return k_; }

private:
    std::size_t k_;
    std::vector<ScoredIndex> items_;
};

// -----------------------------
// Summary row
// -----------------------------
struct SummaryRow final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double std_sample = 0.0;
    double min_v = 0.0;
    double max_v = 0.0;
};

inline SummaryRow summarize(const OnlineStats& s) noexcept {
    SummaryRow r;
    r.n = s.count();
    r.mean = is_finite(s.mean) ? s.mean : 0.0;
    r.std_sample = s.stddev_sample();
    r.min_v = s.min();
    r.max_v = s.max();
    return r;
}

} // namespace midas::stats
