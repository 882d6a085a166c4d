// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace forksim {

// Raised once, before any round executes, when the simulation parameters
// cannot describe a run (empty miner pool, negative rounds or gap).
class InvalidConfiguration : public std::runtime_error {
public:
  explicit InvalidConfiguration(const std::string &what)
      : std::runtime_error("invalid configuration: " + what) {}
};

namespace chain {

// A block was appended to a parent the tree has never seen. Strategies only
// ever return blocks taken from the tree, so this is always a logic error.
class InvalidParent : public std::runtime_error {
public:
  explicit InvalidParent(uint32_t parent_id)
      : std::runtime_error("invalid parent: block " + std::to_string(parent_id) +
                           " is not in the tree"),
        parent_id_(parent_id) {}

  uint32_t parent_id() const { return parent_id_; }

private:
  uint32_t parent_id_;
};

// Lookup of an unknown id through a query that must return a block
class UnknownBlock : public std::out_of_range {
public:
  explicit UnknownBlock(uint32_t block_id)
      : std::out_of_range("unknown block " + std::to_string(block_id)) {}
};

} // namespace chain
} // namespace forksim
