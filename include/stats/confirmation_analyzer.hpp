// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <string>
#include <vector>

namespace forksim {

namespace chain {
class BlockTree;
} // namespace chain

namespace mining {
class MinerPool;
} // namespace mining

namespace stats {

struct MinerConfirmation {
  std::string miner_id;
  chain::MinerGroup group{chain::MinerGroup::HONEST};
  int mined{0};
  int included{0};
  double rate_pct{0.0}; // included / mined * 100, 0 when nothing was mined
};

struct GroupConfirmation {
  int miners{0};
  int mined{0};
  int included{0};
  double rate_pct{100.0}; // 100 when the group mined nothing
};

struct ConfirmationStats {
  std::vector<MinerConfirmation> miners; // pool order (H1.., then C1..)
  GroupConfirmation honest;
  GroupConfirmation colluding;
  int canonical_length{0}; // canonical blocks except genesis
};

// ConfirmationAnalyzer - Share of each miner's blocks on the canonical path
class ConfirmationAnalyzer {
public:
  explicit ConfirmationAnalyzer(const chain::BlockTree &tree) : tree_(tree) {}

  // Count canonical blocks per miner, record them in each Miner's
  // blocks_included and return the per-miner and per-group rates
  ConfirmationStats Analyze(mining::MinerPool &pool) const;

private:
  const chain::BlockTree &tree_;
};

} // namespace stats
} // namespace forksim
