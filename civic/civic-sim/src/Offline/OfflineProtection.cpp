// Ticket: 0004_offline_protection

#include "civic-sim/src/Offline/OfflineProtection.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

namespace offline
{

double clampOfflineDrift(double delta,
                         uint32_t weeksOffline,
                         const OfflineClampConfig& config)
{
  if (!std::isfinite(delta))
  {
    throw ValidationError{"Offline drift delta must be finite"};
  }
  if (!std::isfinite(config.maxNegativeDriftPerWeek) ||
      config.maxNegativeDriftPerWeek < 0.0)
  {
    throw ValidationError{std::format(
      "maxNegativeDriftPerWeek must be non-negative, got {}",
      config.maxNegativeDriftPerWeek)};
  }

  if (weeksOffline <= config.gracePeriodWeeks || delta >= 0.0)
  {
    return delta;
  }

  double const floor =
    -config.maxNegativeDriftPerWeek *
    static_cast<double>(weeksOffline - config.gracePeriodWeeks);
  return std::max(delta, floor);
}

double computeCatchUpBuff(uint32_t weeksOffline,
                          double maxBuff,
                          double halfLifeWeeks)
{
  if (!std::isfinite(maxBuff) || maxBuff < 1.0)
  {
    throw ValidationError{
      std::format("Catch-up maxBuff must be >= 1, got {}", maxBuff)};
  }
  if (!std::isfinite(halfLifeWeeks) || halfLifeWeeks <= 0.0)
  {
    throw ValidationError{std::format(
      "Catch-up halfLifeWeeks must be positive, got {}", halfLifeWeeks)};
  }

  double const growth =
    1.0 - std::exp(-static_cast<double>(weeksOffline) / halfLifeWeeks);
  // Guard the asymptote against rounding
  return std::min(maxBuff, 1.0 + (maxBuff - 1.0) * growth);
}

OfflineAdjustment computeOfflineAdjustment(const OfflineSnapshot& snapshot,
                                           uint32_t currentTick,
                                           double rawDelta,
                                           const OfflineClampConfig& clampConfig,
                                           const CatchUpConfig& catchUpConfig)
{
  if (currentTick < snapshot.capturedAtWeek)
  {
    throw ValidationError{std::format(
      "Current tick {} precedes snapshot capture week {} for player '{}'",
      currentTick,
      snapshot.capturedAtWeek,
      snapshot.playerId)};
  }

  OfflineAdjustment adjustment{};
  adjustment.weeksOffline = currentTick - snapshot.capturedAtWeek;
  adjustment.adjustedDelta =
    clampOfflineDrift(rawDelta, adjustment.weeksOffline, clampConfig);
  adjustment.catchUpBuff = computeCatchUpBuff(adjustment.weeksOffline,
                                              catchUpConfig.maxBuff,
                                              catchUpConfig.halfLifeWeeks);
  return adjustment;
}

AutopilotProfile autopilotProfile(AutopilotStrategy strategy)
{
  switch (strategy)
  {
    case AutopilotStrategy::Defensive:
      return AutopilotProfile{0.85, 0.50};
    case AutopilotStrategy::Balanced:
      return AutopilotProfile{1.00, 0.25};
    case AutopilotStrategy::Growth:
      return AutopilotProfile{1.15, 0.00};
  }
  return AutopilotProfile{};
}

}  // namespace offline

std::string_view toString(AutopilotStrategy strategy)
{
  switch (strategy)
  {
    case AutopilotStrategy::Defensive:
      return "Defensive";
    case AutopilotStrategy::Balanced:
      return "Balanced";
    case AutopilotStrategy::Growth:
      return "Growth";
  }
  return "Unknown";
}

AutopilotStrategy autopilotStrategyFromString(std::string_view name)
{
  if (name == "Defensive")
  {
    return AutopilotStrategy::Defensive;
  }
  if (name == "Balanced")
  {
    return AutopilotStrategy::Balanced;
  }
  if (name == "Growth")
  {
    return AutopilotStrategy::Growth;
  }
  throw ValidationError{std::format("Unknown autopilot strategy '{}'", name)};
}

}  // namespace civic_sim
