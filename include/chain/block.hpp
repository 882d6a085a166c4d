// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace forksim {
namespace chain {

// Blocks are numbered in creation order; genesis is 0
using BlockId = uint32_t;
static constexpr BlockId NULL_BLOCK_ID = std::numeric_limits<BlockId>::max();

static constexpr const char *GENESIS_MINER_ID = "genesis";

enum class MinerGroup : uint8_t {
  HONEST,   // Always extends the canonical tip
  COLLUDING // Follows the shared gap-bounded fork
};

// "honest" / "colluding"
std::string MinerGroupToString(MinerGroup group);

/**
 * Block - One mined unit in the block tree
 *
 * Every field is fixed at construction. BlockTree owns all Block objects
 * (std::map node storage, so addresses are stable) and hands out const
 * references/pointers only.
 */
class Block {
public:
  Block(BlockId id, const Block *parent, std::string miner, MinerGroup miner_group,
        bool best_at_creation);

  //! Creation-order identifier (genesis = 0)
  const BlockId id;

  //! Height in the tree (parent height + 1, genesis = 0)
  const int nHeight;

  /**
   * Parent block (DOES NOT OWN).
   *
   * nullptr for genesis only. Points to a Block owned by the same BlockTree.
   */
  const Block *const pprev;

  //! Label of the miner that produced this block ("H1", "C2", "genesis")
  const std::string miner_id;

  const MinerGroup group;

  //! True if this block became the canonical tip when it was mined
  const bool best_at_creation;

  [[nodiscard]] bool IsGenesis() const noexcept { return pprev == nullptr; }

  [[nodiscard]] BlockId GetParentId() const noexcept {
    return pprev ? pprev->id : NULL_BLOCK_ID;
  }

  // Walk parent links back to the ancestor at the given height
  // (nullptr if height is negative or above this block)
  [[nodiscard]] const Block *GetAncestor(int height) const;

  // For debugging/testing only
  [[nodiscard]] std::string ToString() const;

  // Blocks are referenced by pointer from children and the tip set
  Block(const Block &) = delete;
  Block &operator=(const Block &) = delete;
  Block(Block &&) = delete;
  Block &operator=(Block &&) = delete;
};

} // namespace chain
} // namespace forksim
