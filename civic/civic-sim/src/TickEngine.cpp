// Ticket: 0001_tick_scheduler

#include "civic-sim/src/TickEngine.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <thread>

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

namespace
{

// Clears the processing flag however runTickAt() exits
class ProcessingGuard
{
public:
  explicit ProcessingGuard(std::atomic<bool>& flag) : flag_{flag}
  {
    flag_.store(true);
  }

  ~ProcessingGuard()
  {
    flag_.store(false);
  }

  ProcessingGuard(const ProcessingGuard&) = delete;
  ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
  std::atomic<bool>& flag_;
};

std::vector<std::vector<std::string>> makeBatches(
  const std::vector<std::string>& players,
  size_t batchSize)
{
  std::vector<std::vector<std::string>> batches;
  if (players.empty())
  {
    // Processors still get one call so tick-wide work runs
    batches.emplace_back();
    return batches;
  }
  for (size_t begin = 0; begin < players.size(); begin += batchSize)
  {
    size_t const end = std::min(players.size(), begin + batchSize);
    batches.emplace_back(players.begin() + static_cast<std::ptrdiff_t>(begin),
                         players.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return batches;
}

// Runs fn and returns the message of anything it threw
template <typename Fn>
std::optional<std::string> captureFailure(Fn&& fn)
{
  try
  {
    fn();
  }
  catch (const std::exception& e)
  {
    return std::string{e.what()};
  }
  catch (...)
  {
    return std::string{"unknown exception"};
  }
  return std::nullopt;
}

}  // namespace

TickEngine::TickEngine(TickStore& store) : TickEngine{store, Config{}}
{
}

TickEngine::TickEngine(TickStore& store, Config config)
  : config_{std::move(config)},
    logger_{config_.logger ? config_.logger : spdlog::default_logger()},
    scheduler_{store, TickScheduler::Config{config_.tickTimeout}, config_.clock},
    tracker_{store, config_.clock},
    snapshots_{store}
{
  if (config_.batchSize == 0)
  {
    throw std::invalid_argument{"TickEngine batchSize must be at least 1"};
  }
  if (config_.workerThreads == 0)
  {
    throw std::invalid_argument{"TickEngine workerThreads must be at least 1"};
  }
  if (!config_.clock)
  {
    config_.clock = []() { return WallClock::now(); };
  }
}

void TickEngine::registerProcessor(std::unique_ptr<TickProcessor> processor)
{
  if (!processor)
  {
    throw std::invalid_argument{"Cannot register a null processor"};
  }

  std::scoped_lock lock{processorsMutex_};
  auto const duplicate = std::ranges::any_of(
    processors_,
    [&](const std::unique_ptr<TickProcessor>& existing)
    { return existing->name() == processor->name(); });
  if (duplicate)
  {
    throw std::invalid_argument{"Processor '" + std::string{processor->name()} +
                                "' is already registered"};
  }

  auto const position = std::ranges::upper_bound(
    processors_,
    processor->priority(),
    {},
    [](const std::unique_ptr<TickProcessor>& existing)
    { return existing->priority(); });
  processors_.insert(position, std::move(processor));
}

PlayerTickState TickEngine::registerPlayer(const std::string& playerId)
{
  return tracker_.getOrCreate(playerId);
}

TickRecord TickEngine::runTick(const TickRequest& request)
{
  if (request.dryRun)
  {
    return runTickAt(scheduler_.getNextGameTime(), request);
  }

  if (auto recovered = scheduler_.recoverStuckTick())
  {
    logger_->warn("Recovered stuck tick {} at {}: {}",
                  recovered->tickId,
                  recovered->gameTime.toString(),
                  recovered->result->failureReason);
  }
  return runTickAt(scheduler_.getNextGameTime(), request);
}

std::optional<TickRecord> TickEngine::advanceTo(WallClock::time_point now)
{
  if (!config_.schedule)
  {
    throw std::runtime_error{"advanceTo() requires a configured TickSchedule"};
  }

  if (auto recovered = scheduler_.recoverStuckTick())
  {
    logger_->warn("Recovered stuck tick {} at {}: {}",
                  recovered->tickId,
                  recovered->gameTime.toString(),
                  recovered->result->failureReason);
  }

  GameTime const expected = config_.schedule->expectedAt(now);
  auto const last = scheduler_.getLastCompletedTick();
  if (last && expected <= last->gameTime)
  {
    return std::nullopt;
  }

  TickRequest request{};
  uint32_t const missed = scheduler_.getMissedTicks(expected);
  if (missed > 0)
  {
    logger_->warn("Missed {} tick(s); running one catch-up tick at {}",
                  missed,
                  expected.toString());
    request.triggeredBy = TickTrigger::Catchup;
  }
  else
  {
    request.triggeredBy = TickTrigger::Scheduled;
  }
  return runTickAt(expected, request);
}

TickRecord TickEngine::forceCompleteTick(const std::string& tickId,
                                         const std::string& reason)
{
  TickRecord record = scheduler_.forceCompleteTick(tickId, reason);
  logger_->warn("Tick {} force-completed by operator: {}",
                record.tickId,
                record.result->failureReason);
  return record;
}

TickEngineState TickEngine::state() const
{
  TickEngineState state{};
  if (auto last = scheduler_.getLastCompletedTick())
  {
    state.lastTick = last->gameTime;
    state.lastTickAt = last->completedAt;
  }
  state.ticksProcessed = scheduler_.completedTickCount();
  state.isProcessing = processing_.load();

  std::scoped_lock lock{stateMutex_};
  state.currentProcessor = currentProcessor_;
  return state;
}

void TickEngine::captureOfflineSnapshot(const OfflineSnapshot& snapshot)
{
  snapshots_.capture(snapshot);
  logger_->debug("Captured offline snapshot for {} at week {}",
                 snapshot.playerId,
                 snapshot.capturedAtWeek);
}

std::optional<OfflineSnapshot> TickEngine::consumeOfflineSnapshot(
  const std::string& playerId)
{
  return snapshots_.consume(playerId);
}

// ========== Tick execution ==========

TickRecord TickEngine::runTickAt(const GameTime& gameTime,
                                 const TickRequest& request)
{
  if (request.playerId && request.playerId->empty())
  {
    throw ValidationError{"Tick request player id must not be empty"};
  }
  if (request.dryRun)
  {
    return runDryTick(gameTime, request);
  }

  std::string const tickId = TickScheduler::tickIdFor(gameTime);

  TickRecord record{};
  try
  {
    record = scheduler_.recordTick(
      tickId, gameTime, request.triggeredBy, request.triggeredByUserId);
  }
  catch (const ConcurrentTickError& e)
  {
    logger_->error("Tick {} rejected: {}", tickId, e.what());
    throw;
  }
  catch (const ClockDriftError& e)
  {
    logger_->critical("Clock drift on tick {}: {}", tickId, e.what());
    throw;
  }

  ProcessingGuard guard{processing_};
  logger_->info("Tick {} started at {} ({})",
                record.tickId,
                gameTime.toString(),
                toString(record.triggeredBy));

  TickResult result{};
  auto const abortTick = [&](const std::string& reason)
  {
    setCurrentProcessor(std::nullopt);
    logger_->error("Tick {} aborted: {}", record.tickId, reason);
    result.failureReason = reason;
    scheduler_.completeTick(record.tickId, std::move(result));
  };

  try
  {
    auto const players = collectPlayers(gameTime, request);
    runProcessors(record, request, players, result);
  }
  catch (const std::exception& e)
  {
    abortTick(e.what());
    throw;
  }
  catch (...)
  {
    abortTick("unknown exception");
    throw;
  }

  setCurrentProcessor(std::nullopt);
  TickRecord completed = scheduler_.completeTick(record.tickId, std::move(result));

  if (completed.success)
  {
    logger_->info("Tick {} completed in {:.1f} ms: {} processor(s), {} item(s)",
                  completed.tickId,
                  completed.durationMs.value_or(0.0),
                  completed.processorsRun.size(),
                  completed.totalItemsProcessed);
  }
  else
  {
    logger_->warn("Tick {} failed in {:.1f} ms: {} error(s){}",
                  completed.tickId,
                  completed.durationMs.value_or(0.0),
                  completed.totalErrors,
                  completed.result->failureReason.empty()
                    ? std::string{}
                    : ", " + completed.result->failureReason);
  }
  return completed;
}

TickRecord TickEngine::runDryTick(const GameTime& gameTime,
                                  const TickRequest& request)
{
  if (auto active = scheduler_.getActiveTick())
  {
    throw ConcurrentTickError{
      "Cannot dry-run while tick '" + active->tickId + "' is running",
      active->tickId};
  }

  TickRecord record{};
  record.tickId = TickScheduler::tickIdFor(gameTime);
  record.gameTime = gameTime;
  record.triggeredBy = request.triggeredBy;
  record.triggeredByUserId = request.triggeredByUserId;
  record.startedAt = config_.clock();

  ProcessingGuard guard{processing_};
  logger_->info("Dry run of tick {} at {}", record.tickId, gameTime.toString());

  // getOrCreate would register the player, so the filter only reads here
  std::vector<std::string> players;
  if (request.playerId)
  {
    auto const player = tracker_.find(*request.playerId);
    if (player && (request.force || player->lastProcessedTick < gameTime))
    {
      players.push_back(player->playerId);
    }
  }
  else
  {
    players = request.force ? tracker_.playerIds()
                            : tracker_.getUnprocessedPlayers(gameTime);
  }

  TickResult result{};
  result.dryRun = true;
  runProcessors(record, request, players, result);
  setCurrentProcessor(std::nullopt);

  applyResult(record, std::move(result), config_.clock());
  logger_->info("Dry run of tick {} finished: {} item(s), {} error(s)",
                record.tickId,
                record.totalItemsProcessed,
                record.totalErrors);
  return record;
}

std::vector<std::string> TickEngine::collectPlayers(const GameTime& gameTime,
                                                    const TickRequest& request)
{
  if (request.playerId)
  {
    PlayerTickState const player = tracker_.getOrCreate(*request.playerId);
    if (request.force || player.lastProcessedTick < gameTime)
    {
      return {player.playerId};
    }
    return {};
  }
  if (request.force)
  {
    return tracker_.playerIds();
  }
  return tracker_.getUnprocessedPlayers(gameTime);
}

void TickEngine::runProcessors(const TickRecord& record,
                               const TickRequest& request,
                               const std::vector<std::string>& players,
                               TickResult& result)
{
  auto const batches = makeBatches(players, config_.batchSize);
  auto const deadline = record.startedAt + config_.tickTimeout;
  ProcessorOptions const options{record.gameTime, request.dryRun, request.force};

  std::scoped_lock lock{processorsMutex_};
  for (const auto& processor : processors_)
  {
    std::string name{"<unnamed>"};
    bool runnable = false;
    auto const readinessFailure = captureFailure(
      [&]()
      {
        name = std::string{processor->name()};
        if (!processor->enabled())
        {
          logger_->debug("Processor {} disabled, skipped", name);
          return;
        }
        if (auto reason = processor->validate())
        {
          logger_->warn("Processor {} not ready, skipped: {}", name, *reason);
          return;
        }
        runnable = true;
      });

    TickProcessorResult processorResult{};
    if (readinessFailure)
    {
      logger_->error("Processor {} failed its readiness check: {}",
                     name,
                     *readinessFailure);
      processorResult.processor = name;
      processorResult.success = false;
      processorResult.errors.push_back(
        TickError{"", "processor", *readinessFailure, true});
    }
    else if (!runnable)
    {
      continue;
    }
    else
    {
      if (config_.clock() > deadline)
      {
        result.timedOut = true;
        result.failureReason = "Tick timed out before processor '" + name + "'";
        logger_->error("Tick {}: {}", record.tickId, result.failureReason);
        return;
      }

      setCurrentProcessor(name);
      processorResult = runProcessor(*processor, name, options, batches);
    }

    bool const failed = !processorResult.success;
    result.processors.push_back(std::move(processorResult));

    if (failed && !config_.continueOnError)
    {
      result.failureReason = "Processor '" + name + "' failed";
      logger_->error("Tick {}: stopping after processor {} failed",
                     record.tickId,
                     name);
      return;
    }
  }
}

TickProcessorResult TickEngine::runProcessor(
  TickProcessor& processor,
  const std::string& name,
  const ProcessorOptions& options,
  const std::vector<std::vector<std::string>>& batches)
{
  auto const start = config_.clock();

  TickProcessorResult result{};
  result.processor = name;

  auto const outcomes = runBatches(processor, options, batches);
  for (size_t i = 0; i < outcomes.size(); ++i)
  {
    const BatchOutcome& batch = outcomes[i];
    if (batch.failure)
    {
      // Nobody in a batch whose call threw is marked processed
      logger_->error("Processor {} failed on batch {}: {}",
                     name,
                     i,
                     *batch.failure);
      result.errors.push_back(
        TickError{"", "processor", *batch.failure, true});
      continue;
    }

    result.itemsProcessed += batch.outcome.itemsProcessed;
    for (const auto& [key, value] : batch.outcome.summary)
    {
      result.summary[key] += value;
    }

    std::set<std::string> failedPlayers;
    for (const auto& error : batch.outcome.errors)
    {
      if (error.entityType == "player")
      {
        failedPlayers.insert(error.entityId);
      }
      result.errors.push_back(error);
    }

    if (options.dryRun)
    {
      continue;
    }
    for (const auto& playerId : batches[i])
    {
      if (!failedPlayers.contains(playerId))
      {
        tracker_.markProcessed(playerId, options.gameTime, name);
      }
    }
  }

  result.success = result.errors.empty();
  result.durationMs =
    std::chrono::duration<double, std::milli>(config_.clock() - start).count();
  return result;
}

std::vector<TickEngine::BatchOutcome> TickEngine::runBatches(
  TickProcessor& processor,
  const ProcessorOptions& options,
  const std::vector<std::vector<std::string>>& batches)
{
  std::vector<BatchOutcome> outcomes(batches.size());

  auto runOne = [&](size_t index)
  {
    outcomes[index].failure = captureFailure(
      [&]()
      { outcomes[index].outcome = processor.process(options, batches[index]); });
  };

  size_t const workers =
    std::min<size_t>(config_.workerThreads, batches.size());
  if (workers <= 1)
  {
    for (size_t i = 0; i < batches.size(); ++i)
    {
      runOne(i);
    }
    return outcomes;
  }

  // Batches are disjoint; each worker claims the next unprocessed index
  std::atomic<size_t> next{0};
  {
    std::vector<std::jthread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w)
    {
      threads.emplace_back(
        [&]()
        {
          for (size_t i = next.fetch_add(1); i < batches.size();
               i = next.fetch_add(1))
          {
            runOne(i);
          }
        });
    }
  }  // jthreads join here

  return outcomes;
}

void TickEngine::setCurrentProcessor(std::optional<std::string> name)
{
  std::scoped_lock lock{stateMutex_};
  currentProcessor_ = std::move(name);
}

}  // namespace civic_sim
