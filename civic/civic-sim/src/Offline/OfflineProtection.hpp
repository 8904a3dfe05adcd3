// Ticket: 0004_offline_protection

#ifndef CIVIC_SIM_OFFLINE_OFFLINE_PROTECTION_HPP
#define CIVIC_SIM_OFFLINE_OFFLINE_PROTECTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace civic_sim
{

/**
 * @brief Automated behaviour profile for an offline player
 */
enum class AutopilotStrategy : uint8_t
{
  Defensive,  ///< Lower efficiency, fewer scandals
  Balanced,
  Growth      ///< Higher efficiency, no scandal protection
};

/**
 * @brief Fixed modifiers consumed by processors while the player is offline
 */
struct AutopilotProfile
{
  double resourceEfficiencyMultiplier{1.0};
  double scandalProbabilityReduction{0.0};  // Fraction removed, 0..1
};

/**
 * @brief Player state captured when a session ends
 *
 * Consumed once on the player's next login, then discarded.
 */
struct OfflineSnapshot
{
  std::string playerId;
  uint32_t capturedAtWeek{0};
  double influence{0.0};
  std::optional<double> approvalRating;
  AutopilotStrategy autopilotStrategy{AutopilotStrategy::Balanced};
};

/**
 * @brief Limits on negative drift while a player is away
 */
struct OfflineClampConfig
{
  double maxNegativeDriftPerWeek{2.0};
  uint32_t gracePeriodWeeks{1};
};

/**
 * @brief Shape of the returning-player buff
 */
struct CatchUpConfig
{
  double maxBuff{1.5};        // Asymptotic upper bound, >= 1
  double halfLifeWeeks{4.0};  // > 0
};

/**
 * @brief Combined result handed back to processors
 */
struct OfflineAdjustment
{
  double adjustedDelta{0.0};
  double catchUpBuff{1.0};
  uint32_t weeksOffline{0};
};

/**
 * @brief Offline protection: negative-drift clamp and catch-up buff
 *
 * Pure functions, no persistence, safe to call from any thread. Processors
 * must go through computeOfflineAdjustment() rather than reimplementing the
 * clamp or buff.
 *
 * @ticket 0004_offline_protection
 */
namespace offline
{

/**
 * @brief Clamp a negative state change accumulated while offline
 *
 * Inside the grace period the delta is returned unchanged. Beyond it, a
 * negative delta is limited to
 *   -maxNegativeDriftPerWeek * (weeksOffline - gracePeriodWeeks)
 * Positive deltas are never altered.
 *
 * @throws ValidationError on a non-finite delta or an invalid config
 */
double clampOfflineDrift(double delta,
                         uint32_t weeksOffline,
                         const OfflineClampConfig& config);

/**
 * @brief Multiplier granted to a returning player
 *
 * 1 + (maxBuff - 1) * (1 - exp(-weeksOffline / halfLifeWeeks)).
 * Equals 1 at zero weeks, increases monotonically, never exceeds maxBuff.
 *
 * @throws ValidationError if maxBuff < 1 or halfLifeWeeks <= 0
 */
double computeCatchUpBuff(uint32_t weeksOffline,
                          double maxBuff,
                          double halfLifeWeeks);

/**
 * @brief Single entry point for processors
 *
 * weeksOffline = currentTick - snapshot.capturedAtWeek.
 *
 * @throws ValidationError if currentTick precedes the capture week
 */
OfflineAdjustment computeOfflineAdjustment(
  const OfflineSnapshot& snapshot,
  uint32_t currentTick,
  double rawDelta,
  const OfflineClampConfig& clampConfig,
  const CatchUpConfig& catchUpConfig = CatchUpConfig{});

/// @brief Fixed modifiers for a strategy
AutopilotProfile autopilotProfile(AutopilotStrategy strategy);

}  // namespace offline

std::string_view toString(AutopilotStrategy strategy);

/**
 * @brief Parse "Defensive", "Balanced" or "Growth" (case-sensitive)
 * @throws ValidationError for any other value
 */
AutopilotStrategy autopilotStrategyFromString(std::string_view name);

}  // namespace civic_sim

#endif  // CIVIC_SIM_OFFLINE_OFFLINE_PROTECTION_HPP
