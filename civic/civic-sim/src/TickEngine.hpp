// Ticket: 0001_tick_scheduler

#ifndef CIVIC_SIM_TICK_ENGINE_HPP
#define CIVIC_SIM_TICK_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "civic-sim/src/Offline/OfflineSnapshotRegistry.hpp"
#include "civic-sim/src/Persistence/TickStore.hpp"
#include "civic-sim/src/Tick/PlayerTickStateTracker.hpp"
#include "civic-sim/src/Tick/TickProcessor.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"
#include "civic-sim/src/Tick/TickSchedule.hpp"
#include "civic-sim/src/Tick/TickScheduler.hpp"

namespace civic_sim
{

/**
 * @brief Parameters of one tick run
 */
struct TickRequest
{
  TickTrigger triggeredBy{TickTrigger::Manual};
  std::optional<std::string> triggeredByUserId;
  std::optional<std::string> playerId;  // Restrict processing to one player
  bool dryRun{false};  // Run processors without persisting or marking players
  bool force{false};   // Include players already processed this month
};

/**
 * @brief Read-only status view of the engine
 */
struct TickEngineState
{
  std::optional<GameTime> lastTick;
  std::optional<WallClock::time_point> lastTickAt;
  uint32_t ticksProcessed{0};
  bool isProcessing{false};
  std::optional<std::string> currentProcessor;
};

/**
 * @brief Top-level tick orchestrator
 *
 * Owns the global TickScheduler, the PlayerTickStateTracker and the offline
 * snapshot registry, all sharing one TickStore. Holds the processor registry
 * and runs a tick end to end:
 *
 * 1. Recover a stuck tick
 * 2. Record the tick at the next game month
 * 3. Collect lagging players
 * 4. Run enabled, ready processors in priority order over player batches
 * 5. Mark each player processed per system that succeeded for it
 * 6. Complete the tick
 *
 * A processor throwing, from any of its hooks and with any exception type,
 * never escapes runTick(); it becomes a TickError and the tick completes with
 * success=false. Scheduler rejections
 * (ConcurrentTickError, ClockDriftError) and store failures propagate. A
 * tick is never left Running because of an exception thrown here.
 *
 * The store must outlive the engine.
 */
class TickEngine
{
public:
  struct Config
  {
    bool continueOnError{true};  // Keep running processors after a failure
    std::chrono::milliseconds tickTimeout{std::chrono::minutes{5}};
    size_t batchSize{256};        // Players per process() call, >= 1
    unsigned workerThreads{1};    // Concurrent batches per processor, >= 1
    std::optional<TickSchedule> schedule;  // Required by advanceTo()
    std::shared_ptr<spdlog::logger> logger;  // Defaults to spdlog default
    std::function<WallClock::time_point()> clock;  // Defaults to system_clock
  };

  /**
   * @brief Construct an engine over a store with default configuration
   * @throws std::runtime_error if the store cannot be read
   */
  explicit TickEngine(TickStore& store);

  /**
   * @brief Construct an engine over a store
   * @throws std::invalid_argument if batchSize or workerThreads is zero
   * @throws std::runtime_error if the store cannot be read
   */
  TickEngine(TickStore& store, Config config);

  TickEngine(const TickEngine&) = delete;
  TickEngine& operator=(const TickEngine&) = delete;

  /**
   * @brief Add a processor; equal priorities keep registration order
   *
   * Safe to call while a tick runs; it waits until the running tick has
   * finished with its processors.
   *
   * @throws std::invalid_argument on a null processor or duplicate name
   */
  void registerProcessor(std::unique_ptr<TickProcessor> processor);

  /// @brief Track a player (no-op for a known one)
  PlayerTickState registerPlayer(const std::string& playerId);

  /**
   * @brief Run one tick at the next game month
   *
   * A dry run does not record the tick, mark players or recover a stuck
   * tick. It returns a completed record built in memory, with
   * result->dryRun set.
   *
   * @return The completed record
   * @throws ConcurrentTickError if a tick is already Running
   * @throws ClockDriftError if the clock disagrees with history
   * @throws std::runtime_error on store failure
   */
  TickRecord runTick(const TickRequest& request = {});

  /**
   * @brief Scheduled trigger: bring the game clock up to `now`
   *
   * Uses the configured TickSchedule. Does nothing when the clock is up to
   * date. When months were missed, runs a single Catchup tick at the
   * expected month instead of replaying every missed one.
   *
   * @return The completed record, or std::nullopt if no tick was due
   * @throws std::runtime_error if no schedule is configured
   */
  std::optional<TickRecord> advanceTo(WallClock::time_point now);

  /// @brief Operator recovery, see TickScheduler::forceCompleteTick
  TickRecord forceCompleteTick(const std::string& tickId,
                               const std::string& reason);

  TickEngineState state() const;

  // ========== Offline snapshots ==========

  void captureOfflineSnapshot(const OfflineSnapshot& snapshot);

  std::optional<OfflineSnapshot> consumeOfflineSnapshot(
    const std::string& playerId);

  // ========== Accessors ==========

  TickScheduler& getScheduler()
  {
    return scheduler_;
  }

  const TickScheduler& getScheduler() const
  {
    return scheduler_;
  }

  PlayerTickStateTracker& getTracker()
  {
    return tracker_;
  }

  const PlayerTickStateTracker& getTracker() const
  {
    return tracker_;
  }

  const Config& getConfig() const
  {
    return config_;
  }

private:
  struct BatchOutcome
  {
    ProcessorOutcome outcome;
    std::optional<std::string> failure;  // process() threw
  };

  TickRecord runTickAt(const GameTime& gameTime, const TickRequest& request);

  void runProcessors(const TickRecord& record,
                     const TickRequest& request,
                     const std::vector<std::string>& players,
                     TickResult& result);

  TickProcessorResult runProcessor(
    TickProcessor& processor,
    const std::string& name,
    const ProcessorOptions& options,
    const std::vector<std::vector<std::string>>& batches);

  std::vector<BatchOutcome> runBatches(
    TickProcessor& processor,
    const ProcessorOptions& options,
    const std::vector<std::vector<std::string>>& batches);

  TickRecord runDryTick(const GameTime& gameTime, const TickRequest& request);

  std::vector<std::string> collectPlayers(const GameTime& gameTime,
                                          const TickRequest& request);

  void setCurrentProcessor(std::optional<std::string> name);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;

  TickScheduler scheduler_;
  PlayerTickStateTracker tracker_;
  OfflineSnapshotRegistry snapshots_;

  // Sorted by priority, stable for equal priorities
  std::mutex processorsMutex_;
  std::vector<std::unique_ptr<TickProcessor>> processors_;

  std::atomic<bool> processing_{false};
  mutable std::mutex stateMutex_;
  std::optional<std::string> currentProcessor_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_ENGINE_HPP
