// Copyright (c) 2025 The Unicity Foundation
// Test helpers for driving the simulation without a real RNG

#ifndef FORKSIM_TEST_HELPERS_HPP
#define FORKSIM_TEST_HELPERS_HPP

#include "chain/block_tree.hpp"
#include "mining/miner_pool.hpp"
#include "mining/random_source.hpp"
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace forksim {
namespace test {

/**
 * ScriptedRandomSource - Replays a fixed list of miner indices
 *
 * Lets a test decide exactly which miner wins each round. Throws once the
 * script is exhausted so a test that runs too many rounds fails loudly.
 *
 * Usage:
 *   MinerPool pool(1, 1, 2);          // index 0 = H1, index 1 = C1
 *   ScriptedRandomSource rng({1, 0, 0, 1});
 *   RoundSimulator sim(tree, pool, rng);
 *   sim.Run(4);
 */
class ScriptedRandomSource : public mining::RandomSource {
public:
    explicit ScriptedRandomSource(std::initializer_list<size_t> script)
        : script_(script) {}

    size_t NextIndex(size_t bound) override {
        if (pos_ >= script_.size()) {
            throw std::logic_error("ScriptedRandomSource: script exhausted");
        }
        size_t value = script_[pos_++];
        if (value >= bound) {
            throw std::logic_error("ScriptedRandomSource: index out of bound");
        }
        return value;
    }

    size_t Consumed() const { return pos_; }

private:
    std::vector<size_t> script_;
    size_t pos_{0};
};

/**
 * Append `count` blocks in a straight line on top of parent_id
 * @return id of the last block appended (parent_id if count == 0)
 */
inline chain::BlockId ExtendChain(chain::BlockTree& tree, chain::BlockId parent_id,
                                  int count,
                                  chain::MinerGroup group = chain::MinerGroup::HONEST,
                                  const std::string& miner = "H1") {
    chain::BlockId id = parent_id;
    for (int i = 0; i < count; ++i) {
        id = tree.AddBlock(id, group, miner).id;
    }
    return id;
}

// Look up a miner by label (nullptr if the pool has none)
inline const mining::Miner* FindMiner(const mining::MinerPool& pool, const std::string& id) {
    for (const auto& miner : pool.GetMiners()) {
        if (miner.id == id) {
            return &miner;
        }
    }
    return nullptr;
}

// Whole file as a string, empty if it cannot be opened
inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace test
} // namespace forksim

#endif // FORKSIM_TEST_HELPERS_HPP
