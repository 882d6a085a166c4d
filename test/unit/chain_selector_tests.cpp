// Copyright (c) 2025 The Unicity Foundation
// Unit tests for chain/chain_selector.cpp - Tip set and canonical tip choice
//
// These tests verify:
// - BlockHeightComparator ordering (height, then creation order)
// - Leaf-only invariant when a tip is extended
// - Tie-break on equal height

#include <catch2/catch_test_macros.hpp>
#include "chain/chain_selector.hpp"

using namespace forksim::chain;

TEST_CASE("BlockHeightComparator ordering", "[chain_selector]") {
    Block g(0, nullptr, GENESIS_MINER_ID, MinerGroup::HONEST, true);
    Block a(1, &g, "H1", MinerGroup::HONEST, true);
    Block b(2, &g, "C1", MinerGroup::COLLUDING, false);
    Block c(3, &a, "H1", MinerGroup::HONEST, true);

    BlockHeightComparator cmp;

    SECTION("Taller block sorts first") {
        REQUIRE(cmp(&c, &a));
        REQUIRE_FALSE(cmp(&a, &c));
    }

    SECTION("Same height: earlier id sorts first") {
        REQUIRE(cmp(&a, &b));
        REQUIRE_FALSE(cmp(&b, &a));
    }

    SECTION("Irreflexive") {
        REQUIRE_FALSE(cmp(&a, &a));
    }
}

TEST_CASE("ChainSelector tip set", "[chain_selector]") {
    Block g(0, nullptr, GENESIS_MINER_ID, MinerGroup::HONEST, true);
    Block a1(1, &g, "H1", MinerGroup::HONEST, true);
    Block b1(2, &g, "C1", MinerGroup::COLLUDING, false);
    Block a2(3, &a1, "H2", MinerGroup::HONEST, true);

    ChainSelector selector;

    SECTION("Empty selector") {
        REQUIRE(selector.FindBestTip() == nullptr);
        REQUIRE(selector.GetTipCount() == 0);
        REQUIRE(selector.GetTips().empty());
    }

    SECTION("Extending a tip removes the parent") {
        selector.AddTip(&g);
        selector.AddTip(&a1);
        REQUIRE(selector.GetTipCount() == 1);
        REQUIRE(selector.GetTips()[0] == &a1);
    }

    SECTION("Sibling blocks are both tips, earliest wins the tie") {
        selector.AddTip(&g);
        selector.AddTip(&a1);
        selector.AddTip(&b1);
        REQUIRE(selector.GetTipCount() == 2);
        REQUIRE(selector.FindBestTip() == &a1);

        auto tips = selector.GetTips();
        REQUIRE(tips.size() == 2);
        REQUIRE(tips[0] == &a1);
        REQUIRE(tips[1] == &b1);
    }

    SECTION("Taller tip becomes best") {
        selector.AddTip(&g);
        selector.AddTip(&b1);
        selector.AddTip(&a1);
        REQUIRE(selector.FindBestTip() == &a1);
        selector.AddTip(&a2);
        REQUIRE(selector.FindBestTip() == &a2);
        auto tips = selector.GetTips();
        REQUIRE(tips.size() == 2);
        REQUIRE(tips[0] == &a2);
        REQUIRE(tips[1] == &b1);
    }

    SECTION("Null block is ignored") {
        selector.AddTip(nullptr);
        REQUIRE(selector.GetTipCount() == 0);
    }
}
