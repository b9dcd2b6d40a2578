// SPILLWAY - Gauge Component Tests
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include <gtest/gtest.h>

#include "spillway/gauge/accumulator.h"
#include "spillway/gauge/boost.h"
#include "spillway/gauge/params.h"
#include "spillway/gauge/positions.h"
#include "spillway/gauge/registry.h"
#include "spillway/gauge/weights.h"
#include "spillway/util/config.h"

#include <map>

namespace spillway {
namespace gauge {
namespace {

// ============================================================================
// Accumulator Tests
// ============================================================================

TEST(AccumulatorTest, RefreshAccruesRewardPerShare) {
    PoolState state;
    state.lastDistributionTime = 100;
    state.emissionRate = 10;

    AccumulatorEngine::Refresh(state, 1000, 200, 0);

    EXPECT_EQ(state.lastDistributionTime, 200);
    EXPECT_EQ(state.allocatedRewards, 1000);
    EXPECT_EQ(state.rewardPerShare, static_cast<Uint128>(PRECISION));
}

TEST(AccumulatorTest, ZeroBalanceAdvancesClockOnly) {
    PoolState state;
    state.lastDistributionTime = 100;
    state.emissionRate = 10;

    AccumulatorEngine::Refresh(state, 0, 150, 0);

    EXPECT_EQ(state.lastDistributionTime, 150);
    EXPECT_EQ(state.rewardPerShare, static_cast<Uint128>(0));
    EXPECT_EQ(state.allocatedRewards, 500);
}

TEST(AccumulatorTest, EmissionEndClampsTime) {
    PoolState state;
    state.lastDistributionTime = 100;
    state.emissionRate = 10;

    AccumulatorEngine::Refresh(state, 100, 500, 300);
    EXPECT_EQ(state.lastDistributionTime, 300);
    EXPECT_EQ(state.allocatedRewards, 2000);

    Uint128 before = state.rewardPerShare;
    AccumulatorEngine::Refresh(state, 100, 900, 300);
    EXPECT_EQ(state.rewardPerShare, before);
    EXPECT_EQ(state.allocatedRewards, 2000);
}

TEST(AccumulatorTest, StaleTimeIsNoop) {
    PoolState state;
    state.lastDistributionTime = 100;
    state.emissionRate = 10;

    AccumulatorEngine::Refresh(state, 100, 50, 0);
    EXPECT_EQ(state.lastDistributionTime, 100);
    EXPECT_EQ(state.allocatedRewards, 0);
}

TEST(AccumulatorTest, EngineSnapshotDoesNotMutate) {
    std::map<PoolId, Amount> balances{{0, 100}, {1, 0}};
    AccumulatorEngine engine([&](PoolId id) { return balances[id]; });
    engine.AddPool(0, 1000);
    engine.AddPool(1, 1000);
    engine.SetEmissionRate(0, 5);
    engine.SetEmissionRate(1, 5);
    EXPECT_EQ(engine.PoolCount(), 2u);

    auto snap = engine.Snapshot(0, 1010);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->allocatedRewards, 50);

    auto again = engine.Snapshot(0, 1010);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->allocatedRewards, 50);

    engine.Commit(0, *snap);
    auto committed = engine.Snapshot(0, 1010);
    EXPECT_EQ(committed->lastDistributionTime, 1010);

    EXPECT_FALSE(engine.Snapshot(7, 1010).has_value());
}

TEST(AccumulatorTest, RefreshAllIsMonotonic) {
    std::map<PoolId, Amount> balances{{0, 300}};
    AccumulatorEngine engine([&](PoolId id) { return balances[id]; });
    engine.AddPool(0, 0);
    engine.SetEmissionRate(0, 7);

    Uint128 last = 0;
    for (Timestamp t = 10; t <= 100; t += 10) {
        engine.RefreshAll(t);
        auto state = engine.Snapshot(0, t);
        ASSERT_TRUE(state.has_value());
        EXPECT_GE(state->rewardPerShare, last);
        last = state->rewardPerShare;
    }
    EXPECT_EQ(engine.Snapshot(0, 100)->allocatedRewards, 700);
}

// ============================================================================
// Boost Tests
// ============================================================================

TEST(BoostTest, BaseOnlyWithoutPower) {
    BoostCalculator calc;
    EXPECT_EQ(calc.DerivedStake(1000, 1000, 0, 0), 400);
    EXPECT_EQ(calc.DerivedStake(1000, 5000, 0, 100), 400);
    EXPECT_EQ(calc.DerivedStake(0, 5000, 10, 100), 0);
}

TEST(BoostTest, CappedAtStake) {
    BoostCalculator calc;
    // 400 base + 1000 * 6000 / 10000 boosted exceeds the stake
    EXPECT_EQ(calc.DerivedStake(1000, 1000, 50, 50), 1000);
}

TEST(BoostTest, PartialPower) {
    BoostCalculator calc;
    // base 100 + (2000 * 25 / 100) * 0.6 = 100 + 300
    EXPECT_EQ(calc.DerivedStake(250, 2000, 25, 100), 250);
    EXPECT_EQ(calc.DerivedStake(1000, 2000, 25, 100), 700);
}

TEST(BoostTest, CustomSplit) {
    BoostParams params;
    params.baseBps = 10000;
    params.poolBps = 0;
    ASSERT_TRUE(params.IsValid());

    BoostCalculator calc(params);
    EXPECT_EQ(calc.DerivedStake(777, 1000, 5, 10), 777);
}

// ============================================================================
// Weight Allocator Tests
// ============================================================================

class WeightAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        voter_ = AddressFromLabel("voter");
        allocator_.AddPool(0, 0);
        allocator_.AddPool(1, 0);
        allocator_.AddPool(2, 0);
    }

    WeightAllocator::PoolPredicate Known() const {
        return [](PoolId id) { return id < 3; };
    }

    WeightAllocator allocator_;
    Address voter_;
};

TEST_F(WeightAllocatorTest, ValidationRejections) {
    EXPECT_EQ(allocator_.ValidateVote({0, 1}, {1}, Known()), GaugeStatus::LENGTH_MISMATCH);
    EXPECT_EQ(allocator_.ValidateVote({}, {}, Known()), GaugeStatus::EMPTY_VOTE);
    EXPECT_EQ(allocator_.ValidateVote({0, 9}, {1, 1}, Known()), GaugeStatus::UNKNOWN_POOL);
    EXPECT_EQ(allocator_.ValidateVote({0, 1}, {1, -1}, Known()), GaugeStatus::INVALID_AMOUNT);
    EXPECT_EQ(allocator_.ValidateVote({0, 1}, {0, 0}, Known()), GaugeStatus::ZERO_WEIGHT_SUM);
    EXPECT_EQ(allocator_.ValidateVote({0, 1}, {0, 3}, Known()), GaugeStatus::OK);
}

TEST_F(WeightAllocatorTest, DustGoesToLastNonZeroPool) {
    allocator_.Vote(voter_, {0, 1, 2}, {1, 1, 0}, 101);

    EXPECT_EQ(allocator_.GetAllocation(voter_, 0), 50);
    EXPECT_EQ(allocator_.GetAllocation(voter_, 1), 51);
    EXPECT_EQ(allocator_.GetAllocation(voter_, 2), 0);
    EXPECT_EQ(allocator_.GetUsedWeight(voter_), 101);
    EXPECT_EQ(allocator_.GetTotalWeight(), 101);
}

TEST_F(WeightAllocatorTest, RepeatedPoolsMerge) {
    allocator_.Vote(voter_, {2, 0, 2}, {1, 2, 1}, 100);

    auto pools = allocator_.GetVotedPools(voter_);
    ASSERT_EQ(pools.size(), 2u);
    EXPECT_EQ(pools[0], 2u);
    EXPECT_EQ(pools[1], 0u);
    EXPECT_EQ(allocator_.GetAllocation(voter_, 2), 50);
    EXPECT_EQ(allocator_.GetAllocation(voter_, 0), 50);
}

TEST_F(WeightAllocatorTest, RevoteReplacesPriorAllocation) {
    allocator_.Vote(voter_, {0}, {1}, 100);
    allocator_.Vote(voter_, {1}, {1}, 60);

    EXPECT_EQ(allocator_.GetPoolWeight(0), 0);
    EXPECT_EQ(allocator_.GetPoolWeight(1), 60);
    EXPECT_EQ(allocator_.GetTotalWeight(), 60);
}

TEST_F(WeightAllocatorTest, ResetIsIdempotent) {
    allocator_.Vote(voter_, {0, 1}, {3, 1}, 40);
    allocator_.Reset(voter_);
    allocator_.Reset(voter_);

    EXPECT_EQ(allocator_.GetTotalWeight(), 0);
    EXPECT_EQ(allocator_.GetUsedWeight(voter_), 0);
    EXPECT_TRUE(allocator_.GetVotedPools(voter_).empty());
}

TEST_F(WeightAllocatorTest, ZeroPowerRecordsEmptyAllocations) {
    allocator_.Vote(voter_, {0}, {5}, 0);
    EXPECT_EQ(allocator_.GetVotedPools(voter_).size(), 1u);
    EXPECT_EQ(allocator_.GetUsedWeight(voter_), 0);
    EXPECT_EQ(allocator_.GetTotalWeight(), 0);
}

TEST_F(WeightAllocatorTest, HeadroomBoundsTotalWeight) {
    allocator_.AddPool(0, MAX_AMOUNT - 100);
    EXPECT_EQ(allocator_.Headroom(), 100);
    EXPECT_EQ(allocator_.VoteHeadroom(voter_), 100);

    allocator_.Vote(voter_, {1}, {1}, MAX_AMOUNT);
    EXPECT_EQ(allocator_.GetUsedWeight(voter_), 100);
    EXPECT_EQ(allocator_.GetTotalWeight(), MAX_AMOUNT);
    EXPECT_EQ(allocator_.Headroom(), 0);

    // A revote may reuse the voter's own weight
    EXPECT_EQ(allocator_.VoteHeadroom(voter_), 100);
    allocator_.Vote(voter_, {2}, {1}, 60);
    EXPECT_EQ(allocator_.GetTotalWeight(), MAX_AMOUNT - 40);
}

TEST_F(WeightAllocatorTest, DeriveRates) {
    EXPECT_FALSE(allocator_.DeriveRates(1000).has_value());

    allocator_.AddPool(0, 100);
    allocator_.Vote(voter_, {1, 2}, {1, 1}, 200);

    auto rates = allocator_.DeriveRates(1000);
    ASSERT_TRUE(rates.has_value());
    EXPECT_EQ((*rates)[0], 333);
    EXPECT_EQ((*rates)[1], 333);
    EXPECT_EQ((*rates)[2], 333);

    allocator_.RemoveReserved(0, 100);
    EXPECT_EQ(allocator_.GetTotalWeight(), 200);
}

// ============================================================================
// Registry and Position Tests
// ============================================================================

TEST(PoolRegistryTest, AddFindRelease) {
    PoolRegistry registry;
    auto first = registry.Add("LP-A", 500, 10);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0u);
    EXPECT_FALSE(registry.Add("LP-A", 1, 11).has_value());

    auto second = registry.Add("LP-B", 0, 12);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 1u);
    EXPECT_EQ(registry.Size(), 2u);
    EXPECT_EQ(registry.Find("LP-B"), second);
    EXPECT_FALSE(registry.Find("LP-C").has_value());
    EXPECT_EQ(registry.Get(5), nullptr);

    EXPECT_EQ(registry.ReleaseReserved(0), 500);
    EXPECT_FALSE(registry.ReleaseReserved(0).has_value());
    EXPECT_FALSE(registry.ReleaseReserved(1).has_value());
    EXPECT_TRUE(registry.Get(0)->reservedReleased);
}

TEST(PositionLedgerTest, PendingAndCommit) {
    PositionLedger ledger;
    Address alice = AddressFromLabel("alice");

    Position position;
    position.staked = 1000;
    position.derived = 400;
    Uint128 acc = static_cast<Uint128>(PRECISION) * 2;
    EXPECT_EQ(PendingReward(position, acc), static_cast<Uint128>(800));

    AnchorDebt(position, acc);
    EXPECT_EQ(PendingReward(position, acc), static_cast<Uint128>(0));

    ledger.Commit(3, alice, position);
    EXPECT_EQ(ledger.Size(), 1u);
    EXPECT_EQ(ledger.Get(3, alice).staked, 1000);
    EXPECT_EQ(ledger.Get(3, alice).rewardDebt, static_cast<Uint128>(800));
    EXPECT_EQ(ledger.Get(2, alice).staked, 0);

    ledger.Commit(3, alice, Position{});
    EXPECT_EQ(ledger.Size(), 0u);
}

// ============================================================================
// Parameter Tests
// ============================================================================

TEST(ControllerParamsTest, Defaults) {
    ControllerParams params;
    EXPECT_TRUE(params.IsValid());
    EXPECT_EQ(params.emissionWindow, SECONDS_PER_YEAR);
    EXPECT_EQ(params.boost.baseBps, 4000);
    EXPECT_EQ(params.boost.poolBps, 6000);
    EXPECT_FALSE(params.logLevel.has_value());
}

TEST(ControllerParamsTest, FromConfigReadsGaugeSection) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[gauge]\nemission_window=30d\nbase_boost_bps=3000\npool_boost_bps=7000\n"
        "log_level=debug\n").success);

    auto params = ControllerParams::FromConfig(config);
    EXPECT_EQ(params.emissionWindow, 30 * 86400);
    EXPECT_EQ(params.boost.baseBps, 3000);
    EXPECT_EQ(params.boost.poolBps, 7000);
    ASSERT_TRUE(params.logLevel.has_value());
    EXPECT_EQ(*params.logLevel, util::LogLevel::Debug);
}

TEST(ControllerParamsTest, FromConfigIgnoresInvalidValues) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[gauge]\nemission_window=-5\nbase_boost_bps=6000\npool_boost_bps=6000\n"
        "log_level=loud\n").success);

    auto params = ControllerParams::FromConfig(config);
    EXPECT_EQ(params.emissionWindow, DEFAULT_EMISSION_WINDOW);
    EXPECT_EQ(params.boost.baseBps, DEFAULT_BASE_BOOST_BPS);
    EXPECT_EQ(params.boost.poolBps, DEFAULT_POOL_BOOST_BPS);
    EXPECT_FALSE(params.logLevel.has_value());
}

} // namespace
} // namespace gauge
} // namespace spillway
