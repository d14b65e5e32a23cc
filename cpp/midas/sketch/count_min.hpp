#pragma once
/*
===============================================================================
Sketch: Count-Min Rows + Edge/Node Sketches
File: cpp/midas/sketch/count_min.hpp
===============================================================================

Purpose:
  - Approximate per-edge and per-node counts in O(rows * buckets) memory.
  - Each row hashes a key with its own (a, b) pair drawn from a seeded RNG;
    count() takes the minimum across rows.

Contracts:
  - Bucket values are non-negative (weights added are >= 0, decay in (0,1]).
  - Without decay, count() never underestimates inserted weight.
  - Hashing uses wrapping 64-bit arithmetic; keys are raw node ids.
===============================================================================
*/

#include "midas/core/rng.hpp"
#include "midas/core/settings.hpp"

#include <cstddef>
#include <vector>

namespace midas::sketch {

class Row final {
public:
    Row(Int buckets, Xoshiro256pp& rng);

    Int hash(Int m_value, Int source, Int dest) const noexcept;

    void insert(Int m_value, Int source, Int dest, Float weight) noexcept;
    Float count(Int m_value, Int source, Int dest) const noexcept;

    void node_insert(Int node, Float weight) noexcept { insert(0, node, 0, weight); }
    Float node_count(Int node) const noexcept { return count(0, node, 0); }

    void clear() noexcept;
    void lower(Float factor) noexcept;

    std::size_t num_buckets() const noexcept { return buckets_.size(); }
    Int a() const noexcept { return a_; }
    Int b() const noexcept { return b_; }

private:
    Int a_ = 1;
    Int b_ = 0;
    std::vector<Float> buckets_;
};

// Sketch keyed by (source, dest).
class EdgeHash final {
public:
    EdgeHash(const SketchSettings& s, Int seed);

    void insert(Int source, Int dest, Float weight) noexcept;
    Float count(Int source, Int dest) const noexcept;

    void clear() noexcept;
    void lower(Float factor) noexcept;

    std::size_t num_rows() const noexcept { return rows_.size(); }
    const Row& row(std::size_t i) const { return rows_.at(i); }

private:
    Int m_value_;
    std::vector<Row> rows_;
};

// Sketch keyed by a single node id.
class NodeHash final {
public:
    NodeHash(const SketchSettings& s, Int seed);

    void insert(Int node, Float weight) noexcept;
    Float count(Int node) const noexcept;

    void clear() noexcept;
    void lower(Float factor) noexcept;

    std::size_t num_rows() const noexcept { return rows_.size(); }

private:
    std::vector<Row> rows_;
};

} // namespace midas::sketch
