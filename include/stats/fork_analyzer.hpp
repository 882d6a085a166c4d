// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstddef>
#include <vector>

namespace forksim {

namespace chain {
class BlockTree;
} // namespace chain

namespace stats {

// ForkInfo - One fork point (a block with two or more children)
struct ForkInfo {
  chain::BlockId fork_point{chain::NULL_BLOCK_ID};
  int height{0};        // height of the fork point
  int branch_count{0};  // number of children
  int depth{0};         // longest sub-path below the fork point, in blocks
  int span_from{0};     // first height covered by the branches (height + 1)
  int span_to{0};       // height of the deepest branch tip (height + depth)
  int stale_depth{0};   // longest branch that is not the main continuation
  bool on_canonical_chain{false};
};

struct ForkStats {
  std::vector<ForkInfo> forks;   // ordered by fork point id
  int fork_count{0};
  int max_depth{0};
  int max_stale_depth{0};
  size_t mined_blocks{0};        // all blocks except genesis
  size_t canonical_length{0};    // canonical blocks except genesis
  size_t abandoned_blocks{0};    // blocks not on the canonical path
  double abandoned_pct{0.0};     // abandoned / mined * 100 (0 when nothing mined)
};

// ForkAnalyzer - Fork geometry of a finished block tree
//
// The main continuation of a fork point is the child on the canonical path
// when the fork point itself is canonical, otherwise the child with the
// deepest subtree (lowest id on ties). Every other child is a stale branch.
class ForkAnalyzer {
public:
  explicit ForkAnalyzer(const chain::BlockTree &tree) : tree_(tree) {}

  ForkStats Analyze() const;

private:
  const chain::BlockTree &tree_;
};

} // namespace stats
} // namespace forksim
