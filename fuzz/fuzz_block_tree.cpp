// Copyright (c) 2025 The Unicity Foundation
// Fuzz target for block tree construction and fork analysis
//
// This fuzz target grows a BlockTree from arbitrary parent choices and checks
// the structural invariants after every append:
// - Tip set (leaves only, canonical tip = tallest, earliest on ties)
// - Canonical path consistency (CChain vs parent links)
// - Fork/confirmation accounting (abandoned + canonical == mined)
// It also drives the colluding strategy with fuzzed gaps and miner picks.

#include "chain/block_tree.hpp"
#include "errors.hpp"
#include "mining/miner_pool.hpp"
#include "mining/round_simulator.hpp"
#include "stats/confirmation_analyzer.hpp"
#include "stats/fork_analyzer.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>

using namespace forksim;
using namespace forksim::chain;

// Fuzz input parser
class FuzzInput {
public:
    FuzzInput(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    uint8_t ReadByte() {
        if (offset_ >= size_) return 0;
        return data_[offset_++];
    }

    uint16_t ReadUInt16() {
        return static_cast<uint16_t>(ReadByte()) |
               static_cast<uint16_t>(static_cast<uint16_t>(ReadByte()) << 8);
    }

    bool HasMoreData() const { return offset_ < size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

// Random source that replays fuzz bytes
class FuzzRandomSource : public mining::RandomSource {
public:
    explicit FuzzRandomSource(FuzzInput& input) : input_(input) {}

    size_t NextIndex(size_t bound) override {
        return static_cast<size_t>(input_.ReadUInt16()) % bound;
    }

private:
    FuzzInput& input_;
};

static void Check(bool condition) {
    if (!condition) {
        std::abort();
    }
}

static void CheckTreeInvariants(const BlockTree& tree) {
    const Block& best = tree.CanonicalTip();
    Check(tree.ActiveChain().Tip() == &best);
    Check(tree.ActiveChain().Genesis() == &tree.Genesis());

    int genesis_count = 0;
    for (const auto& [id, block] : tree.GetBlockIndex()) {
        if (block.IsGenesis()) {
            ++genesis_count;
            Check(block.nHeight == 0);
        } else {
            Check(block.pprev->id < id);
            Check(block.nHeight == block.pprev->nHeight + 1);
        }
        Check(block.nHeight <= best.nHeight);
    }
    Check(genesis_count == 1);

    for (const Block* tip : tree.Tips()) {
        Check(tree.Children(tip->id).empty());
        Check(tip->nHeight < best.nHeight ||
              (tip->nHeight == best.nHeight && tip->id >= best.id));
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 4) return 0;

    FuzzInput input(data, size);

    // Part 1: arbitrary tree shapes
    {
        BlockTree tree;
        int appended = 0;
        while (input.HasMoreData() && appended < 512) {
            uint8_t op = input.ReadByte();
            BlockId parent = static_cast<BlockId>(input.ReadUInt16() % (tree.GetBlockCount() + 2));
            MinerGroup group = (op & 1) ? MinerGroup::COLLUDING : MinerGroup::HONEST;
            try {
                tree.AddBlock(parent, group, (op & 1) ? "C1" : "H1");
                ++appended;
            } catch (const InvalidParent&) {
                // Out-of-range ids are expected from the input
                Check(parent >= tree.GetBlockCount());
            }
            if ((op & 0x0f) == 0) {
                CheckTreeInvariants(tree);
            }
        }
        CheckTreeInvariants(tree);

        stats::ForkStats forks = stats::ForkAnalyzer(tree).Analyze();
        Check(forks.abandoned_blocks + forks.canonical_length == forks.mined_blocks);
        Check(forks.mined_blocks == static_cast<size_t>(appended));
    }

    // Part 2: full simulation with fuzzed parameters
    {
        FuzzInput sim_input(data, size);
        int honest = sim_input.ReadByte() % 5;
        int colluding = sim_input.ReadByte() % 5;
        int gap = sim_input.ReadByte() % 8;
        if (honest + colluding == 0) return 0;

        BlockTree tree;
        mining::MinerPool pool(honest, colluding, gap);
        FuzzRandomSource rng(sim_input);
        mining::RoundSimulator sim(tree, pool, rng);

        int rounds = static_cast<int>(size % 256);
        sim.Run(rounds);
        CheckTreeInvariants(tree);

        stats::ConfirmationStats conf = stats::ConfirmationAnalyzer(tree).Analyze(pool);
        int mined = 0;
        for (const auto& miner : pool.GetMiners()) {
            Check(miner.blocks_included <= miner.blocks_mined);
            mined += miner.blocks_mined;
        }
        Check(mined == rounds);
        Check(conf.canonical_length == tree.CanonicalTip().nHeight);
        if (gap == 0) {
            Check(tree.Tips().size() == 1);
        }
    }

    return 0;
}
