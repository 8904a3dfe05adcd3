// Ticket: 0004_offline_protection
// Test: drift clamp, catch-up buff and autopilot profiles

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "civic-sim/src/Offline/OfflineProtection.hpp"
#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{
namespace test
{

// ========== clampOfflineDrift ==========

TEST(OfflineProtection, Clamp_WithinGrace_Unchanged)
{
  OfflineClampConfig config{};
  config.maxNegativeDriftPerWeek = 2.0;
  config.gracePeriodWeeks = 3;

  for (uint32_t weeks = 0; weeks <= config.gracePeriodWeeks; ++weeks)
  {
    EXPECT_EQ(offline::clampOfflineDrift(-50.0, weeks, config), -50.0);
    EXPECT_EQ(offline::clampOfflineDrift(12.5, weeks, config), 12.5);
  }
}

TEST(OfflineProtection, Clamp_BeyondGrace_LimitsNegativeDrift)
{
  OfflineClampConfig config{};
  config.maxNegativeDriftPerWeek = 2.0;
  config.gracePeriodWeeks = 1;

  for (uint32_t weeks = 2; weeks < 60; ++weeks)
  {
    for (double delta : {-0.5, -3.0, -40.0, -1000.0})
    {
      double const floor =
        -config.maxNegativeDriftPerWeek *
        static_cast<double>(weeks - config.gracePeriodWeeks);
      double const clamped = offline::clampOfflineDrift(delta, weeks, config);
      EXPECT_GE(clamped, floor);
      EXPECT_GE(clamped, delta);
    }
  }

  EXPECT_DOUBLE_EQ(offline::clampOfflineDrift(-100.0, 5, config), -8.0);
  EXPECT_DOUBLE_EQ(offline::clampOfflineDrift(-3.0, 5, config), -3.0);
}

TEST(OfflineProtection, Clamp_PositiveDeltaNeverAltered)
{
  OfflineClampConfig const config{};
  for (uint32_t weeks = 0; weeks < 100; weeks += 7)
  {
    EXPECT_EQ(offline::clampOfflineDrift(250.0, weeks, config), 250.0);
  }
}

TEST(OfflineProtection, Clamp_InvalidInputs_Throw)
{
  OfflineClampConfig config{};
  EXPECT_THROW(offline::clampOfflineDrift(
                 std::numeric_limits<double>::quiet_NaN(), 4, config),
               ValidationError);

  config.maxNegativeDriftPerWeek = -1.0;
  EXPECT_THROW(offline::clampOfflineDrift(-5.0, 4, config), ValidationError);
}

// ========== computeCatchUpBuff ==========

TEST(OfflineProtection, CatchUpBuff_ZeroWeeksIsOne)
{
  EXPECT_EQ(offline::computeCatchUpBuff(0, 1.5, 4.0), 1.0);
  EXPECT_EQ(offline::computeCatchUpBuff(0, 3.0, 0.5), 1.0);
}

TEST(OfflineProtection, CatchUpBuff_MonotonicAndBounded)
{
  double previous = 1.0;
  for (uint32_t weeks = 0; weeks < 500; ++weeks)
  {
    double const buff = offline::computeCatchUpBuff(weeks, 1.5, 4.0);
    EXPECT_GE(buff, previous);
    EXPECT_LE(buff, 1.5);
    previous = buff;
  }
  EXPECT_NEAR(previous, 1.5, 1e-9);
}

TEST(OfflineProtection, CatchUpBuff_MatchesFormula)
{
  double const expected = 1.0 + 0.5 * (1.0 - std::exp(-1.0));
  EXPECT_DOUBLE_EQ(offline::computeCatchUpBuff(4, 1.5, 4.0), expected);
}

TEST(OfflineProtection, CatchUpBuff_MaxBuffOneIsFlat)
{
  EXPECT_EQ(offline::computeCatchUpBuff(30, 1.0, 4.0), 1.0);
}

TEST(OfflineProtection, CatchUpBuff_InvalidConfig_Throws)
{
  EXPECT_THROW(offline::computeCatchUpBuff(3, 0.9, 4.0), ValidationError);
  EXPECT_THROW(offline::computeCatchUpBuff(3, 1.5, 0.0), ValidationError);
  EXPECT_THROW(offline::computeCatchUpBuff(3, 1.5, -2.0), ValidationError);
}

// ========== computeOfflineAdjustment ==========

TEST(OfflineProtection, Adjustment_CombinesClampAndBuff)
{
  OfflineSnapshot snapshot{};
  snapshot.playerId = "player-9";
  snapshot.capturedAtWeek = 10;

  OfflineClampConfig clamp{};
  clamp.maxNegativeDriftPerWeek = 2.0;
  clamp.gracePeriodWeeks = 1;

  auto const adjustment =
    offline::computeOfflineAdjustment(snapshot, 14, -30.0, clamp);

  EXPECT_EQ(adjustment.weeksOffline, 4U);
  EXPECT_DOUBLE_EQ(adjustment.adjustedDelta, -6.0);
  EXPECT_DOUBLE_EQ(adjustment.catchUpBuff,
                   offline::computeCatchUpBuff(4, 1.5, 4.0));
}

TEST(OfflineProtection, Adjustment_SameWeek_NoEffect)
{
  OfflineSnapshot snapshot{};
  snapshot.playerId = "player-9";
  snapshot.capturedAtWeek = 10;

  auto const adjustment =
    offline::computeOfflineAdjustment(snapshot, 10, -30.0, OfflineClampConfig{});
  EXPECT_EQ(adjustment.weeksOffline, 0U);
  EXPECT_EQ(adjustment.adjustedDelta, -30.0);
  EXPECT_EQ(adjustment.catchUpBuff, 1.0);
}

TEST(OfflineProtection, Adjustment_CurrentBeforeCapture_Throws)
{
  OfflineSnapshot snapshot{};
  snapshot.playerId = "player-9";
  snapshot.capturedAtWeek = 10;

  EXPECT_THROW(
    offline::computeOfflineAdjustment(snapshot, 9, -1.0, OfflineClampConfig{}),
    ValidationError);
}

// ========== Autopilot ==========

TEST(OfflineProtection, Autopilot_ProfilesAreOrdered)
{
  auto const defensive = offline::autopilotProfile(AutopilotStrategy::Defensive);
  auto const balanced = offline::autopilotProfile(AutopilotStrategy::Balanced);
  auto const growth = offline::autopilotProfile(AutopilotStrategy::Growth);

  EXPECT_LT(defensive.resourceEfficiencyMultiplier,
            balanced.resourceEfficiencyMultiplier);
  EXPECT_LT(balanced.resourceEfficiencyMultiplier,
            growth.resourceEfficiencyMultiplier);
  EXPECT_GT(defensive.scandalProbabilityReduction,
            balanced.scandalProbabilityReduction);
  EXPECT_EQ(growth.scandalProbabilityReduction, 0.0);
  EXPECT_EQ(balanced.resourceEfficiencyMultiplier, 1.0);
}

TEST(OfflineProtection, Autopilot_StringRoundTrip)
{
  for (auto strategy : {AutopilotStrategy::Defensive,
                        AutopilotStrategy::Balanced,
                        AutopilotStrategy::Growth})
  {
    EXPECT_EQ(autopilotStrategyFromString(toString(strategy)), strategy);
  }
  EXPECT_THROW(autopilotStrategyFromString("Reckless"), ValidationError);
}

}  // namespace test
}  // namespace civic_sim
