// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace forksim {

namespace chain {
class BlockTree;
} // namespace chain

namespace stats {

// Flattened, read-only view of one block for renderers
struct BlockView {
  chain::BlockId id{chain::NULL_BLOCK_ID};
  chain::BlockId parent_id{chain::NULL_BLOCK_ID}; // NULL_BLOCK_ID for genesis
  int height{0};
  chain::MinerGroup group{chain::MinerGroup::HONEST};
  std::string miner_id;
  bool canonical{false};        // on the final canonical path
  bool best_at_creation{false}; // was the canonical tip when mined
};

// All blocks in creation order
std::vector<BlockView> ExportBlocks(const chain::BlockTree &tree);

// Graphviz digraph of the tree. Nodes are labelled "<id> (<height>)" and
// edges carry the miner id. Colluding blocks are red on light pink; blocks
// that were the canonical tip when mined get a blue, 2pt outline.
std::string ToDot(const chain::BlockTree &tree);

// Block list as a JSON array
nlohmann::json BlocksToJson(const chain::BlockTree &tree);

} // namespace stats
} // namespace forksim
