// Ticket: 0001_tick_scheduler

#ifndef CIVIC_SIM_TICK_TICK_RECORD_HPP
#define CIVIC_SIM_TICK_TICK_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "civic-sim/src/DataTypes/GameTime.hpp"

namespace civic_sim
{

using WallClock = std::chrono::system_clock;

/// @brief What caused a tick to start
enum class TickTrigger : uint8_t
{
  Scheduled,  ///< Cron / schedule
  Manual,     ///< Admin action
  Catchup     ///< Gap detected by getMissedTicks
};

/// @brief Lifecycle position of a tick
enum class TickStatus : uint8_t
{
  Running,
  Completed,
  Failed
};

/**
 * @brief One error raised while a processor ran
 */
struct TickError
{
  std::string entityId;    // Player or entity affected; empty for batch-wide
  std::string entityType;  // "player", "processor", ...
  std::string message;
  bool recoverable{true};
};

/**
 * @brief What a processor reports back for one batch of players
 */
struct ProcessorOutcome
{
  uint32_t itemsProcessed{0};
  std::vector<TickError> errors;
  std::map<std::string, double> summary;  // Processor-specific counters
};

/**
 * @brief Aggregated outcome of one processor over a whole tick
 */
struct TickProcessorResult
{
  std::string processor;
  bool success{true};
  uint32_t itemsProcessed{0};
  std::vector<TickError> errors;
  double durationMs{0.0};
  std::map<std::string, double> summary;  // Summed over batches
};

/**
 * @brief Full result handed to TickScheduler::completeTick
 */
struct TickResult
{
  std::vector<TickProcessorResult> processors;
  bool timedOut{false};
  bool forcedByOperator{false};
  std::string failureReason;  // Non-empty when the tick was cut short
  bool dryRun{false};         // Nothing was persisted or marked processed
};

/**
 * @brief Persisted history entry for one tick
 *
 * Created Running at start; mutated exactly once when completedAt is set and
 * never rewritten afterwards.
 *
 * @ticket 0001_tick_scheduler
 */
struct TickRecord
{
  std::string tickId;
  GameTime gameTime;
  TickTrigger triggeredBy{TickTrigger::Manual};
  std::optional<std::string> triggeredByUserId;
  WallClock::time_point startedAt{};
  std::optional<WallClock::time_point> completedAt;
  std::optional<double> durationMs;
  bool success{false};
  std::vector<std::string> processorsRun;
  uint32_t totalItemsProcessed{0};
  uint32_t totalErrors{0};
  std::optional<TickResult> result;

  [[nodiscard]] bool isRunning() const
  {
    return !completedAt.has_value();
  }

  [[nodiscard]] TickStatus status() const
  {
    if (isRunning())
    {
      return TickStatus::Running;
    }
    return success ? TickStatus::Completed : TickStatus::Failed;
  }
};

/**
 * @brief Close a record with its result
 *
 * Sets completedAt and durationMs, derives processorsRun and the totals from
 * the result, and sets success only when nothing timed out, no failure reason
 * was given and every processor succeeded.
 */
void applyResult(TickRecord& record,
                 TickResult result,
                 WallClock::time_point completedAt);

std::string_view toString(TickTrigger trigger);
std::string_view toString(TickStatus status);

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_TICK_RECORD_HPP
