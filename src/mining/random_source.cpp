// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "mining/random_source.hpp"

namespace forksim {
namespace mining {

uint64_t GenerateSeed() {
  // static random_device prevents fd-exhaustion on OSes where random_device opens /dev/urandom each call
  static std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
}

} // namespace mining
} // namespace forksim
