// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_selector.hpp"
#include "util/logging.hpp"

namespace forksim {
namespace chain {

bool BlockHeightComparator::operator()(const Block *pa, const Block *pb) const {
  // Taller tip first
  if (pa->nHeight != pb->nHeight) {
    return pa->nHeight > pb->nHeight;
  }

  // Same height: earliest created first (deterministic tie-breaker)
  return pa->id < pb->id;
}

const Block *ChainSelector::FindBestTip() const {
  if (m_tips.empty()) {
    return nullptr;
  }
  return *m_tips.begin();
}

void ChainSelector::AddTip(const Block *pblock) {
  if (!pblock) {
    return;
  }

  // If this block extends a tip, the parent is no longer a leaf
  if (pblock->pprev) {
    auto it = m_tips.find(pblock->pprev);
    if (it != m_tips.end()) {
      LOG_CHAIN_TRACE("Removed parent from tips (extended): id={} height={}",
                      pblock->pprev->id, pblock->pprev->nHeight);
      m_tips.erase(it);
    }
  }

  m_tips.insert(pblock);

  LOG_CHAIN_TRACE("Added tip: id={} height={} tips_count={}", pblock->id,
                  pblock->nHeight, m_tips.size());
}

} // namespace chain
} // namespace forksim
