// Ticket: 0001_tick_scheduler

#ifndef CIVIC_SIM_TICK_TICK_PROCESSOR_HPP
#define CIVIC_SIM_TICK_TICK_PROCESSOR_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "civic-sim/src/DataTypes/GameTime.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"

namespace civic_sim
{

/**
 * @brief Per-tick options handed to every process() call
 */
struct ProcessorOptions
{
  GameTime gameTime;
  bool dryRun{false};  // Compute effects but save nothing
  bool force{false};   // Reprocess entities already handled this month
};

/**
 * @brief Contract for a game system that runs once per tick
 *
 * Banking, empire synergy, contracts, elections and the rest implement this
 * outside the core. The engine knows nothing about their internals and only
 * aggregates their counts.
 *
 * process() receives disjoint batches of player ids. When the engine is
 * configured with more than one worker thread, batches of the same processor
 * run concurrently, so implementations must not share mutable per-call state
 * across batches.
 *
 * Throwing from any of these hooks fails this processor only. A throw from
 * process() fails the batch it was called for; other processors and other
 * batches still run.
 */
class TickProcessor
{
public:
  virtual ~TickProcessor() = default;

  /// @brief Unique name; also the system key in PlayerTickState
  virtual std::string_view name() const = 0;

  /// @brief Execution order, lower runs first
  virtual int priority() const
  {
    return 100;
  }

  virtual bool enabled() const
  {
    return true;
  }

  /**
   * @brief Readiness check run before each tick
   * @return std::nullopt when ready, otherwise the reason it is not
   */
  virtual std::optional<std::string> validate()
  {
    return std::nullopt;
  }

  /**
   * @brief Apply this system's effects for the given players
   *
   * Per-player problems are reported as TickError entries with
   * entityType "player" and entityId set to the player id; those players are
   * not marked processed for this system. With options.dryRun set the
   * processor must not persist any change.
   */
  virtual ProcessorOutcome process(const ProcessorOptions& options,
                                   std::span<const std::string> playerIds) = 0;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_TICK_PROCESSOR_HPP
