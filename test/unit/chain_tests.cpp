// Copyright (c) 2025 The Unicity Foundation
// Unit tests for chain/chain.cpp - CChain canonical path

#include <catch2/catch_test_macros.hpp>
#include "chain/chain.hpp"
#include <memory>
#include <vector>

using namespace forksim::chain;

namespace {

// Owns a set of blocks for building chains by hand
class BlockArena {
public:
    const Block* Genesis() {
        return Add(nullptr);
    }

    const Block* Add(const Block* parent, MinerGroup group = MinerGroup::HONEST) {
        blocks_.push_back(std::make_unique<Block>(static_cast<BlockId>(blocks_.size()),
                                                  parent, parent ? "H1" : GENESIS_MINER_ID,
                                                  group, false));
        return blocks_.back().get();
    }

private:
    std::vector<std::unique_ptr<Block>> blocks_;
};

} // namespace

TEST_CASE("CChain empty", "[chain]") {
    CChain chain;
    REQUIRE(chain.Genesis() == nullptr);
    REQUIRE(chain.Tip() == nullptr);
    REQUIRE(chain.Height() == -1);
    REQUIRE(chain[0] == nullptr);
    REQUIRE_FALSE(chain.Contains(nullptr));
}

TEST_CASE("CChain SetTip and queries", "[chain]") {
    BlockArena arena;
    const Block* g = arena.Genesis();
    const Block* b1 = arena.Add(g);
    const Block* b2 = arena.Add(b1);
    const Block* b3 = arena.Add(b2);

    CChain chain;
    chain.SetTip(*b3);

    SECTION("Indexed by height") {
        REQUIRE(chain.Height() == 3);
        REQUIRE(chain.Genesis() == g);
        REQUIRE(chain.Tip() == b3);
        REQUIRE(chain[1] == b1);
        REQUIRE(chain[4] == nullptr);
        REQUIRE(chain[-1] == nullptr);
    }

    SECTION("Next walks forward") {
        REQUIRE(chain.Next(g) == b1);
        REQUIRE(chain.Next(b2) == b3);
        REQUIRE(chain.Next(b3) == nullptr);
    }
}

TEST_CASE("CChain switching branches", "[chain]") {
    // g - b1 - b2 - b3
    //        \- f2 - f3 - f4
    BlockArena arena;
    const Block* g = arena.Genesis();
    const Block* b1 = arena.Add(g);
    const Block* b2 = arena.Add(b1);
    const Block* b3 = arena.Add(b2);
    const Block* f2 = arena.Add(b1, MinerGroup::COLLUDING);
    const Block* f3 = arena.Add(f2, MinerGroup::COLLUDING);
    const Block* f4 = arena.Add(f3, MinerGroup::COLLUDING);

    CChain chain;
    chain.SetTip(*b3);

    SECTION("FindFork locates the branch point") {
        REQUIRE(chain.FindFork(f4) == b1);
        REQUIRE(chain.FindFork(f2) == b1);
        REQUIRE(chain.FindFork(b2) == b2);
        REQUIRE(chain.FindFork(nullptr) == nullptr);
    }

    SECTION("Longer branch replaces the old path") {
        chain.SetTip(*f4);
        REQUIRE(chain.Height() == 4);
        REQUIRE(chain.Tip() == f4);
        REQUIRE(chain[1] == b1);
        REQUIRE(chain[2] == f2);
        REQUIRE(chain[3] == f3);
        REQUIRE(chain.Contains(f2));
        REQUIRE_FALSE(chain.Contains(b2));
        REQUIRE_FALSE(chain.Contains(b3));
        REQUIRE(chain.Next(b1) == f2);
    }

    SECTION("Shorter tip truncates") {
        chain.SetTip(*f2);
        REQUIRE(chain.Height() == 2);
        REQUIRE(chain[2] == f2);
        REQUIRE_FALSE(chain.Contains(b3));
    }
}
