// Ticket: 0001_tick_scheduler

#ifndef CIVIC_SIM_TICK_TICK_SCHEDULER_HPP
#define CIVIC_SIM_TICK_TICK_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "civic-sim/src/DataTypes/GameTime.hpp"
#include "civic-sim/src/Persistence/TickStore.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"

namespace civic_sim
{

/**
 * @brief The single global game clock
 *
 * Tracks tick history and enforces the tick lifecycle:
 *
 *   Idle --recordTick--> Running --completeTick--> Completed | Failed
 *
 * Exactly one tick may be Running. A completed tick, successful or not,
 * consumes its game month: the next tick is always after it. History is
 * loaded from the store once and every transition is written through
 * before the in-memory view changes.
 *
 * Thread-safe.
 *
 * @ticket 0001_tick_scheduler
 */
class TickScheduler
{
public:
  struct Config
  {
    // Running ticks older than this are recovered as Failed
    std::chrono::milliseconds tickTimeout{std::chrono::minutes{5}};
  };

  using Clock = std::function<WallClock::time_point()>;

  /// @brief Scheduler with the default timeout and system clock
  explicit TickScheduler(TickStore& store);

  /**
   * @param store Persistence, must outlive the scheduler
   * @param config Scheduler configuration
   * @param clock Wall clock (defaults to system_clock)
   * @throws std::runtime_error if the stored history is unreadable or holds
   *         more than one Running tick
   */
  TickScheduler(TickStore& store, Config config, Clock clock = {});

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  /// @brief Stable tick id for a game month, e.g. "tick-000013"
  static std::string tickIdFor(const GameTime& gameTime);

  /// @brief GameTime of the latest completed tick, {1, 1, 1} before any
  GameTime getCurrentGameTime() const;

  /// @brief GameTime the next tick must run at
  GameTime getNextGameTime() const;

  /**
   * @brief Start a tick
   *
   * @return The new Running record
   * @throws ValidationError if gameTime is malformed or zero
   * @throws ConcurrentTickError if tickId already exists or a tick is Running
   * @throws ClockDriftError if gameTime is not after the latest completed tick
   */
  TickRecord recordTick(const std::string& tickId,
                        const GameTime& gameTime,
                        TickTrigger triggeredBy,
                        std::optional<std::string> triggeredByUserId = std::nullopt);

  /**
   * @brief Complete a Running tick exactly once
   *
   * success is true only when nothing timed out, no failure reason was given
   * and every processor succeeded. Totals and processorsRun are derived from
   * the result.
   *
   * @return The completed record
   * @throws ValidationError if tickId is unknown or already completed
   */
  TickRecord completeTick(const std::string& tickId, TickResult result);

  /**
   * @brief Months skipped between the latest completed tick and `expected`
   *
   * max(0, expected.totalMonths - lastCompleted.totalMonths - 1), with an
   * absent tick counting as month 0.
   */
  uint32_t getMissedTicks(const GameTime& expected) const;

  std::optional<TickRecord> getActiveTick() const;

  std::optional<TickRecord> getLastCompletedTick() const;

  /// @brief Number of completed ticks, failed ones included
  uint32_t completedTickCount() const;

  /// @brief All ticks in start order
  std::vector<TickRecord> history() const;

  /**
   * @brief Fail the Running tick if it has exceeded the configured timeout
   * @return The recovered record, or std::nullopt if nothing was stuck
   */
  std::optional<TickRecord> recoverStuckTick();

  /**
   * @brief Operator recovery: complete a Running tick as Failed
   * @throws ValidationError if tickId is unknown or already completed
   */
  TickRecord forceCompleteTick(const std::string& tickId,
                               const std::string& reason);

  const Config& getConfig() const
  {
    return config_;
  }

private:
  TickRecord completeLocked(size_t index, TickResult result);
  const TickRecord* lastCompletedLocked() const;

  TickStore& store_;
  Config config_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::vector<TickRecord> history_;
  std::optional<size_t> activeIndex_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_TICK_SCHEDULER_HPP
