// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <vector>

namespace forksim {
namespace chain {

// CChain - In-memory indexed chain of blocks
// Represents a single linear path genesis -> tip as a vector of Block pointers
// Used for the canonical chain of a BlockTree
// Fast O(1) access by height and membership test, does NOT own Block objects

class CChain {
private:
  std::vector<const Block *> vChain;

public:
  CChain() = default;

  // Prevent copying (chains should be owned, not copied)
  CChain(const CChain &) = delete;
  CChain &operator=(const CChain &) = delete;

  const Block *Genesis() const {
    return vChain.size() > 0 ? vChain[0] : nullptr;
  }

  const Block *Tip() const {
    return vChain.size() > 0 ? vChain[vChain.size() - 1] : nullptr;
  }

  const Block *operator[](int nHeight) const {
    if (nHeight < 0 || nHeight >= (int)vChain.size())
      return nullptr;
    return vChain[nHeight];
  }

  // Check whether block is present in this chain
  bool Contains(const Block *pblock) const {
    if (!pblock)
      return false;
    if (pblock->nHeight < 0 || pblock->nHeight >= (int)vChain.size()) {
      return false;
    }
    return vChain[pblock->nHeight] == pblock;
  }

  // Find successor of block in this chain (nullptr if not found or is tip)
  const Block *Next(const Block *pblock) const {
    if (Contains(pblock))
      return (*this)[pblock->nHeight + 1];
    else
      return nullptr;
  }

  // Return maximal height in chain (equal to chain.Tip() ? chain.Tip()->nHeight : -1)
  int Height() const { return int(vChain.size()) - 1; }

  // Set/initialize chain with given tip (walks backwards using pprev to
  // populate the vector, stopping where it meets the previous path)
  void SetTip(const Block &block);

  // Find last common block between this chain and a block (fork point)
  const Block *FindFork(const Block *pblock) const;
};

} // namespace chain
} // namespace forksim
