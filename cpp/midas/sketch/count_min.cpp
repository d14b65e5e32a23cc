/*
===============================================================================
Sketch: Count-Min Rows + Edge/Node Sketches (Implementation)
File: cpp/midas/sketch/count_min.cpp
===============================================================================
*/

#include "midas/sketch/count_min.hpp"

#include <algorithm>
#include <limits>

namespace midas::sketch {

namespace {

std::vector<Row> make_rows(const SketchSettings& s, Int seed) {
    s.validate_or_throw();

    // Rows share one generator so each row gets distinct coefficients.
    Xoshiro256pp rng(seed);
    std::vector<Row> rows;
    rows.reserve(static_cast<std::size_t>(s.rows));
    for (Int i = 0; i < s.rows; ++i) rows.emplace_back(s.buckets, rng);
    return rows;
}

template <typename F>
Float min_over_rows(const std::vector<Row>& rows, F&& per_row) noexcept {
    Float m = std::numeric_limits<Float>::max();
    for (const auto& r : rows) m = std::min(m, per_row(r));
    return m;
}

} // namespace

Row::Row(Int buckets, Xoshiro256pp& rng) {
    MIDAS_ENSURE(buckets >= 2, ErrorCode::kInvalidArgument, "Row: buckets must be >= 2");
    a_ = (static_cast<Int>(rng.next_u32()) % (buckets - 1)) + 1;
    b_ = static_cast<Int>(rng.next_u32()) % buckets;
    buckets_.assign(static_cast<std::size_t>(buckets), 0.0);
}

Int Row::hash(Int m_value, Int source, Int dest) const noexcept {
    // Wraps mod 2^64 before the bucket reduction; unsigned residue is in [0, n).
    return ((m_value * dest + source) * a_ + b_) % static_cast<Int>(buckets_.size());
}

void Row::insert(Int m_value, Int source, Int dest, Float weight) noexcept {
    buckets_[static_cast<std::size_t>(hash(m_value, source, dest))] += weight;
}

Float Row::count(Int m_value, Int source, Int dest) const noexcept {
    return buckets_[static_cast<std::size_t>(hash(m_value, source, dest))];
}

void Row::clear() noexcept {
    std::fill(buckets_.begin(), buckets_.end(), 0.0);
}

void Row::lower(Float factor) noexcept {
    for (auto& v : buckets_) v *= factor;
}

// ----------------------------- EdgeHash --------------------------------------

EdgeHash::EdgeHash(const SketchSettings& s, Int seed)
    : m_value_(s.m_value), rows_(make_rows(s, seed)) {}

void EdgeHash::insert(Int source, Int dest, Float weight) noexcept {
    for (auto& r : rows_) r.insert(m_value_, source, dest, weight);
}

Float EdgeHash::count(Int source, Int dest) const noexcept {
    return min_over_rows(rows_, [&](const Row& r) { return r.count(m_value_, source, dest); });
}

void EdgeHash::clear() noexcept {
    for (auto& r : rows_) r.clear();
}

void EdgeHash::lower(Float factor) noexcept {
    for (auto& r : rows_) r.lower(factor);
}

// ----------------------------- NodeHash --------------------------------------

NodeHash::NodeHash(const SketchSettings& s, Int seed)
    : rows_(make_rows(s, seed)) {}

void NodeHash::insert(Int node, Float weight) noexcept {
    for (auto& r : rows_) r.node_insert(node, weight);
}

Float NodeHash::count(Int node) const noexcept {
    return min_over_rows(rows_, [&](const Row& r) { return r.node_count(node); });
}

void NodeHash::clear() noexcept {
    for (auto& r : rows_) r.clear();
}

void NodeHash::lower(Float factor) noexcept {
    for (auto& r : rows_) r.lower(factor);
}

} // namespace midas::sketch
