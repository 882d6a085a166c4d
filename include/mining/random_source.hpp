// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace forksim {
namespace mining {

// RandomSource - Source of the proof-of-work race outcome
// RoundSimulator draws one index per round; a fixed seed makes a run
// reproducible and tests can substitute a scripted source.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform index in [0, bound). bound must be > 0.
  virtual size_t NextIndex(size_t bound) = 0;
};

// Mersenne Twister (64-bit) seeded once at construction
class SeededRandomSource : public RandomSource {
public:
  explicit SeededRandomSource(uint64_t seed) : seed_(seed), gen_(seed) {}

  size_t NextIndex(size_t bound) override {
    std::uniform_int_distribution<size_t> dist(0, bound - 1);
    return dist(gen_);
  }

  uint64_t GetSeed() const { return seed_; }

private:
  uint64_t seed_;
  std::mt19937_64 gen_;
};

// Fresh seed from std::random_device (used when no seed is configured)
uint64_t GenerateSeed();

} // namespace mining
} // namespace forksim
