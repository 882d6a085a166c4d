// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain.hpp"
#include "util/logging.hpp"

namespace forksim {
namespace chain {

void CChain::SetTip(const Block &block) {
  const Block *pblock = &block;

  LOG_CHAIN_TRACE("CChain::SetTip: new_tip={} height={}", pblock->id,
                  pblock->nHeight);

  // A shorter tip truncates the path; the walk below refills the rest
  vChain.resize(static_cast<size_t>(pblock->nHeight) + 1);

  int blocks_updated = 0;
  while (pblock) {
    size_t idx = static_cast<size_t>(pblock->nHeight);
    if (vChain[idx] == pblock) {
      break; // already set from a previous walk
    }
    vChain[idx] = pblock;
    pblock = pblock->pprev;
    blocks_updated++;
  }

  LOG_CHAIN_TRACE("CChain::SetTip: Updated {} block entries in chain", blocks_updated);
}

const Block *CChain::FindFork(const Block *pblock) const {
  if (pblock == nullptr) {
    return nullptr;
  }

  // If pblock is taller than us, bring it down to our height
  if (pblock->nHeight > Height()) {
    pblock = pblock->GetAncestor(Height());
  }

  // Walk backwards until we find a block that's in our chain
  int steps = 0;
  while (pblock && !Contains(pblock)) {
    pblock = pblock->pprev;
    steps++;
  }

  if (pblock) {
    LOG_CHAIN_TRACE("CChain::FindFork: fork point id={} height={} (walked {} steps)",
                    pblock->id, pblock->nHeight, steps);
  }

  return pblock;
}

} // namespace chain
} // namespace forksim
