// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "stats/graph_export.hpp"
#include "chain/block_tree.hpp"
#include "util/string_parsing.hpp"
#include <sstream>

namespace forksim {
namespace stats {

std::vector<BlockView> ExportBlocks(const chain::BlockTree &tree) {
  const chain::CChain &active = tree.ActiveChain();

  std::vector<BlockView> out;
  out.reserve(tree.GetBlockCount());
  for (const auto &[id, block] : tree.GetBlockIndex()) {
    BlockView view;
    view.id = id;
    view.parent_id = block.GetParentId();
    view.height = block.nHeight;
    view.group = block.group;
    view.miner_id = block.miner_id;
    view.canonical = active.Contains(&block);
    view.best_at_creation = block.best_at_creation;
    out.push_back(view);
  }
  return out;
}

std::string ToDot(const chain::BlockTree &tree) {
  std::ostringstream dot;
  dot << "digraph {\n";

  for (const BlockView &view : ExportBlocks(tree)) {
    if (view.parent_id == chain::NULL_BLOCK_ID) {
      dot << "\t" << view.id << " [label=genesis]\n";
      continue;
    }

    dot << "\t" << view.id << " [label=\"" << view.id << " (" << view.height << ")\"";
    if (view.group == chain::MinerGroup::COLLUDING) {
      dot << " color=red fillcolor=lightpink style=filled";
    }
    // Graphviz keeps the last color: a blue outline replaces the red one
    if (view.best_at_creation) {
      dot << " color=blue penwidth=2";
    }
    dot << "]\n";
    dot << "\t" << view.parent_id << " -> " << view.id << " [label=\""
        << util::EscapeDotString(view.miner_id) << "\"]\n";
  }

  dot << "}\n";
  return dot.str();
}

nlohmann::json BlocksToJson(const chain::BlockTree &tree) {
  nlohmann::json blocks = nlohmann::json::array();
  for (const BlockView &view : ExportBlocks(tree)) {
    nlohmann::json b = {{"id", view.id},
                        {"height", view.height},
                        {"group", chain::MinerGroupToString(view.group)},
                        {"miner", view.miner_id},
                        {"canonical", view.canonical},
                        {"best_at_creation", view.best_at_creation}};
    if (view.parent_id == chain::NULL_BLOCK_ID) {
      b["parent"] = nullptr;
    } else {
      b["parent"] = view.parent_id;
    }
    blocks.push_back(b);
  }
  return blocks;
}

} // namespace stats
} // namespace forksim
