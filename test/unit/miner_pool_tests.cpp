// Copyright (c) 2025 The Unicity Foundation
// Unit tests for mining/miner_pool.cpp - Miner population and selection

#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "mining/miner_pool.hpp"
#include "test_helpers.hpp"

using namespace forksim;
using namespace forksim::chain;
using namespace forksim::mining;
using forksim::test::FindMiner;
using forksim::test::ScriptedRandomSource;

TEST_CASE("MinerPool labels and order", "[miner_pool]") {
    MinerPool pool(3, 2, 5);

    REQUIRE(pool.size() == 5);
    REQUIRE(pool.GetHonestCount() == 3);
    REQUIRE(pool.GetColludingCount() == 2);

    const auto& miners = pool.GetMiners();
    REQUIRE(miners[0].id == "H1");
    REQUIRE(miners[2].id == "H3");
    REQUIRE(miners[3].id == "C1");
    REQUIRE(miners[4].id == "C2");
    REQUIRE(miners[0].group == MinerGroup::HONEST);
    REQUIRE(miners[4].group == MinerGroup::COLLUDING);
    for (const auto& miner : miners) {
        REQUIRE(miner.blocks_mined == 0);
        REQUIRE(miner.blocks_included == 0);
    }

    REQUIRE(FindMiner(pool, "C2") == &miners[4]);
    REQUIRE(FindMiner(pool, "H4") == nullptr);
    REQUIRE(pool.GetColludingStrategy().GetGap() == 5);
}

TEST_CASE("MinerPool one-sided pools", "[miner_pool]") {
    SECTION("Honest only") {
        MinerPool pool(2, 0, 0);
        REQUIRE(pool.size() == 2);
        REQUIRE(FindMiner(pool, "C1") == nullptr);
    }

    SECTION("Colluding only") {
        MinerPool pool(0, 3, 1);
        REQUIRE(pool.size() == 3);
        REQUIRE(pool.GetMiners()[0].id == "C1");
    }
}

TEST_CASE("MinerPool rejects invalid configuration", "[miner_pool]") {
    REQUIRE_THROWS_AS(MinerPool(0, 0, 5), InvalidConfiguration);
    REQUIRE_THROWS_AS(MinerPool(-1, 2, 5), InvalidConfiguration);
    REQUIRE_THROWS_AS(MinerPool(2, -1, 5), InvalidConfiguration);
    REQUIRE_THROWS_AS(MinerPool(2, 2, -1), InvalidConfiguration);
}

TEST_CASE("MinerPool selection and strategies", "[miner_pool]") {
    MinerPool pool(2, 1, 3);

    SECTION("SelectMiner follows the random source") {
        ScriptedRandomSource rng({2, 0, 1});
        REQUIRE(pool.SelectMiner(rng).id == "C1");
        REQUIRE(pool.SelectMiner(rng).id == "H1");
        REQUIRE(pool.SelectMiner(rng).id == "H2");
    }

    SECTION("One strategy per group") {
        MiningStrategy& honest = pool.StrategyFor(MinerGroup::HONEST);
        MiningStrategy& colluding = pool.StrategyFor(MinerGroup::COLLUDING);
        REQUIRE(&honest != &colluding);
        REQUIRE(&colluding == &pool.GetColludingStrategy());
        REQUIRE(&pool.StrategyFor(MinerGroup::HONEST) == &honest);
    }
}
