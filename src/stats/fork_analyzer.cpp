// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "stats/fork_analyzer.hpp"
#include "chain/block_tree.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace forksim {
namespace stats {

ForkStats ForkAnalyzer::Analyze() const {
  ForkStats stats;

  const auto &index = tree_.GetBlockIndex();
  const chain::CChain &active = tree_.ActiveChain();

  // deepest[id] = height of the deepest tip in the subtree rooted at id.
  // Children are always created after their parent (larger id), so one
  // reverse sweep sees every child before its parent.
  std::vector<int> deepest(index.size(), 0);
  for (auto it = index.rbegin(); it != index.rend(); ++it) {
    const chain::Block &block = it->second;
    deepest[block.id] = std::max(deepest[block.id], block.nHeight);
    if (block.pprev) {
      deepest[block.pprev->id] = std::max(deepest[block.pprev->id], deepest[block.id]);
    }
  }

  for (const auto &[id, block] : index) {
    const std::vector<chain::BlockId> &children = tree_.Children(id);
    if (children.size() < 2) {
      continue;
    }

    ForkInfo info;
    info.fork_point = id;
    info.height = block.nHeight;
    info.branch_count = static_cast<int>(children.size());
    info.depth = deepest[id] - block.nHeight;
    info.span_from = block.nHeight + 1;
    info.span_to = deepest[id];
    info.on_canonical_chain = active.Contains(&block);

    chain::BlockId main_child = children.front();
    if (const chain::Block *next = info.on_canonical_chain ? active.Next(&block) : nullptr) {
      main_child = next->id;
    } else {
      for (chain::BlockId child : children) {
        if (deepest[child] > deepest[main_child]) {
          main_child = child;
        }
      }
    }

    for (chain::BlockId child : children) {
      if (child != main_child) {
        info.stale_depth = std::max(info.stale_depth, deepest[child] - block.nHeight);
      }
    }

    LOG_STATS_TRACE("Fork at block {} (height {}): {} branches, depth {}, stale depth {}",
                    id, info.height, info.branch_count, info.depth, info.stale_depth);

    stats.max_depth = std::max(stats.max_depth, info.depth);
    stats.max_stale_depth = std::max(stats.max_stale_depth, info.stale_depth);
    stats.forks.push_back(info);
  }

  stats.fork_count = static_cast<int>(stats.forks.size());
  stats.mined_blocks = index.size() - 1;
  stats.canonical_length = static_cast<size_t>(active.Height());
  stats.abandoned_blocks = stats.mined_blocks - stats.canonical_length;
  stats.abandoned_pct =
      stats.mined_blocks == 0
          ? 0.0
          : static_cast<double>(stats.abandoned_blocks) * 100.0 /
                static_cast<double>(stats.mined_blocks);

  LOG_STATS_DEBUG("Fork analysis: {} fork(s), max depth {}, {} of {} block(s) abandoned",
                  stats.fork_count, stats.max_depth, stats.abandoned_blocks,
                  stats.mined_blocks);
  return stats;
}

} // namespace stats
} // namespace forksim
