// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstddef>
#include <set>
#include <vector>

namespace forksim {
namespace chain {

// Comparator for sorting tips (strict weak ordering for std::set)
// Ordering (descending sort - best tip first):
//   1) Greater height (pa->nHeight > pb->nHeight)
//   2) Earlier creation (pa->id < pb->id)
//
// Every block costs the same abstract work, so height stands in for chain
// work. The earliest-created block wins a height tie, which keeps the
// canonical tip stable until a strictly taller block appears.
//
// CRITICAL INVARIANT: nHeight and id are const members of Block, so set
// ordering cannot be corrupted after insertion.
struct BlockHeightComparator {
  bool operator()(const Block *pa, const Block *pb) const;
};

// ChainSelector - Maintains the tip set and selects the canonical tip
// Keeps exactly the leaves of the block tree (blocks without children).
// The canonical tip is the first element of the ordered set.
//
// THREAD SAFETY: No internal mutex - owned by BlockTree, single writer
class ChainSelector {
public:
  ChainSelector() = default;

  // Best tip (first in sorted set), nullptr if empty
  const Block *FindBestTip() const;

  // Add a newly created leaf. If it extends a current tip, the parent is
  // removed (maintains leaf-only invariant).
  void AddTip(const Block *pblock);

  size_t GetTipCount() const { return m_tips.size(); }

  // All tips, best first
  std::vector<const Block *> GetTips() const {
    return std::vector<const Block *>(m_tips.begin(), m_tips.end());
  }

private:
  std::set<const Block *, BlockHeightComparator> m_tips;
};

} // namespace chain
} // namespace forksim
