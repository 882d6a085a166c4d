// Copyright (c) 2025 The Unicity Foundation
// Unit tests for stats/fork_analyzer.cpp - Fork points and abandoned blocks

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "chain/block_tree.hpp"
#include "stats/fork_analyzer.hpp"
#include "test_helpers.hpp"

using namespace forksim;
using namespace forksim::chain;
using namespace forksim::stats;
using forksim::test::ExtendChain;
using Catch::Approx;

TEST_CASE("ForkAnalyzer on trees without forks", "[fork_analyzer]") {
    BlockTree tree;

    SECTION("Genesis only") {
        ForkStats stats = ForkAnalyzer(tree).Analyze();
        REQUIRE(stats.fork_count == 0);
        REQUIRE(stats.forks.empty());
        REQUIRE(stats.max_depth == 0);
        REQUIRE(stats.mined_blocks == 0);
        REQUIRE(stats.canonical_length == 0);
        REQUIRE(stats.abandoned_blocks == 0);
        REQUIRE(stats.abandoned_pct == 0.0);
    }

    SECTION("Linear chain") {
        ExtendChain(tree, 0, 10);
        ForkStats stats = ForkAnalyzer(tree).Analyze();
        REQUIRE(stats.fork_count == 0);
        REQUIRE(stats.mined_blocks == 10);
        REQUIRE(stats.canonical_length == 10);
        REQUIRE(stats.abandoned_blocks == 0);
    }
}

TEST_CASE("ForkAnalyzer fork geometry", "[fork_analyzer]") {
    // 0 - 1 - 2 - 3 - 4        canonical
    //      \- 5 - 6
    //          \- 7
    BlockTree tree;
    ExtendChain(tree, 0, 4);
    ExtendChain(tree, 1, 2, MinerGroup::COLLUDING, "C1");
    tree.AddBlock(5, MinerGroup::COLLUDING, "C2");

    ForkStats stats = ForkAnalyzer(tree).Analyze();
    REQUIRE(stats.fork_count == 2);
    REQUIRE(stats.forks.size() == 2);

    SECTION("Fork on the canonical path") {
        const ForkInfo& fork = stats.forks[0];
        REQUIRE(fork.fork_point == 1);
        REQUIRE(fork.height == 1);
        REQUIRE(fork.branch_count == 2);
        REQUIRE(fork.depth == 3);
        REQUIRE(fork.span_from == 2);
        REQUIRE(fork.span_to == 4);
        REQUIRE(fork.stale_depth == 2);
        REQUIRE(fork.on_canonical_chain);
    }

    SECTION("Fork inside a stale branch") {
        const ForkInfo& fork = stats.forks[1];
        REQUIRE(fork.fork_point == 5);
        REQUIRE(fork.height == 2);
        REQUIRE(fork.branch_count == 2);
        REQUIRE(fork.depth == 1);
        REQUIRE(fork.span_from == 3);
        REQUIRE(fork.span_to == 3);
        REQUIRE(fork.stale_depth == 1);
        REQUIRE_FALSE(fork.on_canonical_chain);
    }

    SECTION("Aggregates") {
        REQUIRE(stats.max_depth == 3);
        REQUIRE(stats.max_stale_depth == 2);
        REQUIRE(stats.mined_blocks == 7);
        REQUIRE(stats.canonical_length == 4);
        REQUIRE(stats.abandoned_blocks == 3);
        REQUIRE(stats.abandoned_pct == Approx(300.0 / 7.0));
    }
}

TEST_CASE("ForkAnalyzer edge cases", "[fork_analyzer]") {
    BlockTree tree;

    SECTION("Equal-height siblings at genesis") {
        tree.AddBlock(0, MinerGroup::HONEST, "H1");
        tree.AddBlock(0, MinerGroup::COLLUDING, "C1");

        ForkStats stats = ForkAnalyzer(tree).Analyze();
        REQUIRE(stats.fork_count == 1);
        REQUIRE(stats.forks[0].fork_point == 0);
        REQUIRE(stats.forks[0].depth == 1);
        REQUIRE(stats.forks[0].stale_depth == 1);
        REQUIRE(stats.abandoned_blocks == 1);
        REQUIRE(stats.abandoned_pct == Approx(50.0));
    }

    SECTION("Three-way fork counts every branch") {
        tree.AddBlock(0, MinerGroup::HONEST, "H1");
        tree.AddBlock(0, MinerGroup::HONEST, "H2");
        tree.AddBlock(0, MinerGroup::COLLUDING, "C1");

        ForkStats stats = ForkAnalyzer(tree).Analyze();
        REQUIRE(stats.fork_count == 1);
        REQUIRE(stats.forks[0].branch_count == 3);
        REQUIRE(stats.abandoned_blocks == 2);
    }

    SECTION("Stale branch that used to be canonical") {
        // 0 - 1 - 2           (canonical until 5 arrives)
        //  \- 3 - 4 - 5
        ExtendChain(tree, 0, 2);
        ExtendChain(tree, 0, 3, MinerGroup::COLLUDING, "C1");

        ForkStats stats = ForkAnalyzer(tree).Analyze();
        REQUIRE(stats.fork_count == 1);
        const ForkInfo& fork = stats.forks[0];
        REQUIRE(fork.depth == 3);
        REQUIRE(fork.stale_depth == 2);
        REQUIRE(stats.canonical_length == 3);
        REQUIRE(stats.abandoned_blocks == 2);
    }
}
