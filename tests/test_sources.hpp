/**
 * @file test_sources.hpp
 * @brief Deterministic RandomSource implementations for tests.
 */
#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "wbr/routing/random_source.hpp"

namespace wbr::test {

/// Returns the same value every call; counts how often it was consulted.
class FixedSource final : public wbr::routing::RandomSource {
public:
  explicit FixedSource(double v) : value_(v) {}
  double uniform(double, double) override { ++calls_; return value_; }
  std::size_t calls() const noexcept { return calls_; }
private:
  double value_;
  std::size_t calls_{0};
};

/// Replays a scripted sequence, wrapping around at the end. `seq` must not be empty.
class ScriptedSource final : public wbr::routing::RandomSource {
public:
  explicit ScriptedSource(std::vector<double> seq) : seq_(std::move(seq)) {
    assert(!seq_.empty() && "ScriptedSource needs at least one value");
  }
  double uniform(double, double) override {
    const double v = seq_[pos_ % seq_.size()];
    ++pos_;
    return v;
  }
  std::size_t calls() const noexcept { return pos_; }
private:
  std::vector<double> seq_;
  std::size_t pos_{0};
};

/// Sweeps [lo,hi) in `steps` equal increments, then starts over.
class CyclingSource final : public wbr::routing::RandomSource {
public:
  explicit CyclingSource(std::uint32_t steps) : steps_(steps) {}
  double uniform(double lo, double hi) override {
    const auto k = n_++ % steps_;
    return lo + (hi - lo) * static_cast<double>(k) / static_cast<double>(steps_);
  }
private:
  std::uint32_t steps_;
  std::uint64_t n_{0};
};

} // namespace wbr::test
