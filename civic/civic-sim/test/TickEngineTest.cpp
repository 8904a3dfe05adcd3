// Ticket: 0001_tick_scheduler
// Test: TickEngine orchestration end to end

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "civic-sim/src/Persistence/MemoryTickStore.hpp"
#include "civic-sim/src/TickEngine.hpp"
#include "civic-sim/src/Utils/Errors.hpp"
#include "civic-sim/test/Helpers/ManualClock.hpp"
#include "civic-sim/test/Helpers/RecordingProcessor.hpp"

namespace civic_sim
{
namespace test
{

namespace
{

// Captures the engine's status view while it runs
class StateWatchProcessor final : public TickProcessor
{
public:
  explicit StateWatchProcessor(const TickEngine*& engine) : engine_{engine}
  {
  }

  std::string_view name() const override
  {
    return "watcher";
  }

  ProcessorOutcome process(const ProcessorOptions&,
                           std::span<const std::string> playerIds) override
  {
    observed = engine_->state();
    return ProcessorOutcome{static_cast<uint32_t>(playerIds.size()), {}};
  }

  TickEngineState observed;

private:
  const TickEngine*& engine_;
};

// Burns wall-clock time inside a tick
class SlowProcessor final : public TickProcessor
{
public:
  SlowProcessor(ManualClock clock, std::chrono::minutes cost)
    : clock_{std::move(clock)}, cost_{cost}
  {
  }

  std::string_view name() const override
  {
    return "slow";
  }

  int priority() const override
  {
    return 1;
  }

  ProcessorOutcome process(const ProcessorOptions&,
                           std::span<const std::string>) override
  {
    clock_.advance(cost_);
    return ProcessorOutcome{};
  }

private:
  ManualClock clock_;
  std::chrono::minutes cost_;
};

// Holds the first tick inside process() until the test has seen it enter
class GateProcessor final : public TickProcessor
{
public:
  GateProcessor(std::promise<void>& entered, std::atomic<bool>& finished)
    : entered_{entered}, finished_{finished}
  {
  }

  std::string_view name() const override
  {
    return "gate";
  }

  ProcessorOutcome process(const ProcessorOptions&,
                           std::span<const std::string>) override
  {
    if (!signalled_)
    {
      signalled_ = true;
      entered_.set_value();
      std::this_thread::sleep_for(std::chrono::milliseconds{50});
      finished_.store(true);
    }
    return ProcessorOutcome{};
  }

private:
  std::promise<void>& entered_;
  std::atomic<bool>& finished_;
  bool signalled_{false};
};

}  // namespace

class TickEngineTest : public ::testing::Test
{
protected:
  TickEngine::Config makeConfig() const
  {
    TickEngine::Config config{};
    config.logger = makeNullLogger();
    config.clock = clock_.callable();
    config.tickTimeout = std::chrono::minutes{5};
    return config;
  }

  std::unique_ptr<TickEngine> makeEngine(TickEngine::Config config)
  {
    return std::make_unique<TickEngine>(store_, std::move(config));
  }

  std::unique_ptr<TickEngine> makeEngine()
  {
    return makeEngine(makeConfig());
  }

  static size_t countOf(const std::vector<std::string>& values,
                        const std::string& value)
  {
    return static_cast<size_t>(std::ranges::count(values, value));
  }

  MemoryTickStore store_;
  ManualClock clock_;
  std::shared_ptr<ProcessorLog> log_ = std::make_shared<ProcessorLog>();
};

// ========== Basic tick ==========

TEST_F(TickEngineTest, RunTick_FirstTickAtFirstMonthMarksPlayers)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");
  engine->registerPlayer("bob");

  auto const record = engine->runTick();

  EXPECT_EQ(record.gameTime, GameTime::start());
  EXPECT_EQ(record.tickId, "tick-000001");
  EXPECT_TRUE(record.success);
  EXPECT_EQ(record.totalItemsProcessed, 2U);
  EXPECT_EQ(record.processorsRun, (std::vector<std::string>{"banking"}));

  for (const auto* player : {"alice", "bob"})
  {
    auto const state = engine->getTracker().find(player);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lastProcessedTick, GameTime::start());
    EXPECT_EQ(state->perSystemState.at("banking").lastProcessed,
              GameTime::start());
  }
  EXPECT_TRUE(
    engine->getTracker().getUnprocessedPlayers(GameTime::start()).empty());
}

TEST_F(TickEngineTest, RunTick_ConsecutiveTicksAdvanceClock)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));

  EXPECT_EQ(engine->runTick().gameTime.totalMonths, 1U);
  EXPECT_EQ(engine->runTick().gameTime.totalMonths, 2U);
  EXPECT_EQ(engine->runTick().gameTime.totalMonths, 3U);
  EXPECT_EQ(engine->state().ticksProcessed, 3U);
}

TEST_F(TickEngineTest, RunTick_NoPlayersStillCallsProcessorOnce)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));

  auto const record = engine->runTick();
  EXPECT_TRUE(record.success);
  EXPECT_EQ(log_->calls, 1U);
  EXPECT_TRUE(log_->playersSeen.empty());
}

TEST_F(TickEngineTest, RunTick_OnlyLaggingPlayersProcessed)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");
  engine->getTracker().markProcessed("bob", GameTime::start(), "import");

  engine->runTick();

  EXPECT_EQ(log_->playersSeen, (std::vector<std::string>{"alice"}));
}

TEST_F(TickEngineTest, RunTick_PlayerFilterRestrictsProcessing)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");
  engine->registerPlayer("bob");

  TickRequest request{};
  request.playerId = "bob";
  request.triggeredByUserId = "admin";
  auto const record = engine->runTick(request);

  EXPECT_EQ(record.triggeredByUserId.value_or(""), "admin");
  EXPECT_EQ(log_->playersSeen, (std::vector<std::string>{"bob"}));
  EXPECT_TRUE(engine->getTracker().find("alice")->lastProcessedTick.isZero());

  // Alice lags and is caught up by the next global tick
  engine->runTick();
  EXPECT_EQ(engine->getTracker().find("alice")->lastProcessedTick.totalMonths, 2U);
}

// ========== Dry runs and forced ticks ==========

TEST_F(TickEngineTest, DryRun_NothingRecordedOrMarked)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");

  TickRequest request{};
  request.dryRun = true;
  auto const preview = engine->runTick(request);

  EXPECT_EQ(preview.gameTime, GameTime::start());
  EXPECT_FALSE(preview.isRunning());
  EXPECT_TRUE(preview.success);
  EXPECT_EQ(preview.totalItemsProcessed, 1U);
  ASSERT_TRUE(preview.result.has_value());
  EXPECT_TRUE(preview.result->dryRun);
  EXPECT_EQ(log_->dryRunCalls, 1U);

  EXPECT_TRUE(engine->getScheduler().history().empty());
  EXPECT_TRUE(store_.loadTickRecords().empty());
  EXPECT_TRUE(engine->getTracker().find("alice")->lastProcessedTick.isZero());
  EXPECT_FALSE(engine->state().isProcessing);

  // The month is still free for the real tick
  auto const real = engine->runTick();
  EXPECT_EQ(real.gameTime, GameTime::start());
  EXPECT_FALSE(real.result->dryRun);
  EXPECT_EQ(engine->getTracker().find("alice")->lastProcessedTick,
            GameTime::start());
}

TEST_F(TickEngineTest, DryRun_WhileTickRunning_ThrowsConcurrent)
{
  auto engine = makeEngine();
  engine->getScheduler().recordTick(
    "external", GameTime::start(), TickTrigger::Manual);

  TickRequest request{};
  request.dryRun = true;
  EXPECT_THROW(engine->runTick(request), ConcurrentTickError);
}

TEST_F(TickEngineTest, Force_IncludesPlayersAlreadyAtThisMonth)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("bob");
  engine->getTracker().markProcessed("alice", GameTime::start(), "import");

  TickRequest request{};
  request.force = true;
  engine->runTick(request);

  EXPECT_EQ(log_->playersSeen, (std::vector<std::string>{"alice", "bob"}));
  EXPECT_EQ(log_->forcedCalls, 1U);
  EXPECT_EQ(engine->getTracker().find("alice")->perSystemState.at("banking")
              .lastProcessed,
            GameTime::start());
}

TEST_F(TickEngineTest, Summary_SummedAcrossBatches)
{
  auto config = makeConfig();
  config.batchSize = 1;
  auto engine = makeEngine(config);
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  for (const auto* player : {"alice", "bob", "carol"})
  {
    engine->registerPlayer(player);
  }

  auto const record = engine->runTick();

  ASSERT_EQ(record.result->processors.size(), 1U);
  EXPECT_EQ(record.result->processors[0].summary,
            (std::map<std::string, double>{{"batches", 3.0}, {"players", 3.0}}));
}

// ========== Failure isolation ==========

TEST_F(TickEngineTest, ProcessorThrowing_IsolatedAndCounted)
{
  auto engine = makeEngine();
  RecordingProcessor::Behaviour broken{};
  broken.priority = 10;
  broken.throwOnProcess = true;
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", log_, broken));
  engine->registerProcessor(std::make_unique<RecordingProcessor>("elections", log_));
  engine->registerPlayer("alice");

  TickRecord record{};
  ASSERT_NO_THROW(record = engine->runTick());

  EXPECT_FALSE(record.success);
  EXPECT_FALSE(record.isRunning());
  EXPECT_EQ(record.totalErrors, 1U);
  EXPECT_EQ(record.processorsRun,
            (std::vector<std::string>{"banking", "elections"}));
  ASSERT_TRUE(record.result.has_value());
  const auto& failed = record.result->processors[0];
  EXPECT_FALSE(failed.success);
  ASSERT_EQ(failed.errors.size(), 1U);
  EXPECT_EQ(failed.errors[0].entityType, "processor");
  EXPECT_EQ(failed.errors[0].message, "banking exploded");
  EXPECT_TRUE(record.result->processors[1].success);

  auto const alice = engine->getTracker().find("alice");
  ASSERT_TRUE(alice.has_value());
  EXPECT_FALSE(alice->perSystemState.contains("banking"));
  EXPECT_EQ(alice->perSystemState.at("elections").lastProcessed,
            GameTime::start());
}

TEST_F(TickEngineTest, PlayerError_OnlyThatPlayerLeftBehind)
{
  auto engine = makeEngine();
  RecordingProcessor::Behaviour picky{};
  picky.failingPlayers = {"bob"};
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", log_, picky));
  engine->registerPlayer("alice");
  engine->registerPlayer("bob");

  auto const record = engine->runTick();

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.totalErrors, 1U);
  EXPECT_EQ(record.totalItemsProcessed, 1U);
  EXPECT_EQ(engine->getTracker().find("alice")->lastProcessedTick,
            GameTime::start());
  EXPECT_TRUE(engine->getTracker().find("bob")->lastProcessedTick.isZero());
  EXPECT_EQ(engine->getTracker().getUnprocessedPlayers(GameTime::start()),
            (std::vector<std::string>{"bob"}));
}

TEST_F(TickEngineTest, ValidateThrowing_IsolatedLikeProcess)
{
  auto engine = makeEngine();
  RecordingProcessor::Behaviour broken{};
  broken.priority = 10;
  broken.throwOnValidate = true;
  auto brokenLog = std::make_shared<ProcessorLog>();
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", brokenLog, broken));
  RecordingProcessor::Behaviour late{};
  late.priority = 200;
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("elections", log_, late));
  engine->registerPlayer("alice");

  TickRecord record{};
  ASSERT_NO_THROW(record = engine->runTick());

  EXPECT_FALSE(record.success);
  EXPECT_FALSE(record.isRunning());
  EXPECT_EQ(record.totalErrors, 1U);
  EXPECT_EQ(brokenLog->calls, 0U);
  EXPECT_EQ(log_->calls, 1U);
  ASSERT_EQ(record.result->processors.size(), 2U);
  const auto& failed = record.result->processors[0];
  EXPECT_EQ(failed.processor, "banking");
  EXPECT_FALSE(failed.success);
  ASSERT_EQ(failed.errors.size(), 1U);
  EXPECT_EQ(failed.errors[0].entityType, "processor");
  EXPECT_EQ(failed.errors[0].message, "banking readiness check exploded");

  auto const alice = engine->getTracker().find("alice");
  EXPECT_EQ(alice->lastProcessedTick, GameTime::start());
  EXPECT_FALSE(alice->perSystemState.contains("banking"));
}

TEST_F(TickEngineTest, NonStandardThrow_TickCompletedAndNextTickRuns)
{
  auto engine = makeEngine();
  RecordingProcessor::Behaviour broken{};
  broken.throwNonStandard = true;
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", log_, broken));
  engine->registerPlayer("alice");

  TickRecord record{};
  ASSERT_NO_THROW(record = engine->runTick());

  EXPECT_FALSE(record.success);
  EXPECT_FALSE(record.isRunning());
  ASSERT_EQ(record.result->processors.size(), 1U);
  ASSERT_EQ(record.result->processors[0].errors.size(), 1U);
  EXPECT_EQ(record.result->processors[0].errors[0].message, "unknown exception");
  EXPECT_FALSE(engine->getScheduler().getActiveTick().has_value());

  EXPECT_EQ(engine->runTick().gameTime.totalMonths, 2U);
}

TEST_F(TickEngineTest, NonStandardThrow_OnWorkerThreadsIsolated)
{
  auto config = makeConfig();
  config.batchSize = 1;
  config.workerThreads = 2;
  auto engine = makeEngine(config);
  RecordingProcessor::Behaviour broken{};
  broken.throwNonStandard = true;
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", log_, broken));
  engine->registerPlayer("alice");
  engine->registerPlayer("bob");

  TickRecord record{};
  ASSERT_NO_THROW(record = engine->runTick());

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.totalErrors, 2U);
  EXPECT_EQ(log_->calls, 2U);
  EXPECT_FALSE(engine->getScheduler().getActiveTick().has_value());
  EXPECT_EQ(engine->getTracker().getUnprocessedPlayers(GameTime::start()),
            (std::vector<std::string>{"alice", "bob"}));
}

TEST_F(TickEngineTest, ContinueOnErrorFalse_StopsAfterFailure)
{
  auto config = makeConfig();
  config.continueOnError = false;
  auto engine = makeEngine(config);

  RecordingProcessor::Behaviour broken{};
  broken.priority = 10;
  broken.throwOnProcess = true;
  engine->registerProcessor(
    std::make_unique<RecordingProcessor>("banking", log_, broken));
  engine->registerProcessor(std::make_unique<RecordingProcessor>("elections", log_));

  auto const record = engine->runTick();

  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.processorsRun, (std::vector<std::string>{"banking"}));
  EXPECT_EQ(countOf(log_->callOrder, "elections"), 0U);
  EXPECT_EQ(record.result->failureReason, "Processor 'banking' failed");
}

// ========== Ordering and skipping ==========

TEST_F(TickEngineTest, Processors_RunInPriorityOrderStable)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "contracts", log_, RecordingProcessor::Behaviour{.priority = 300}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "banking", log_, RecordingProcessor::Behaviour{.priority = 10}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "synergy", log_, RecordingProcessor::Behaviour{.priority = 10}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "elections", log_, RecordingProcessor::Behaviour{.priority = 50}));

  auto const record = engine->runTick();

  std::vector<std::string> const expected{
    "banking", "synergy", "elections", "contracts"};
  EXPECT_EQ(log_->callOrder, expected);
  EXPECT_EQ(record.processorsRun, expected);
}

TEST_F(TickEngineTest, DisabledAndNotReadyProcessors_Skipped)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "dormant", log_, RecordingProcessor::Behaviour{.enabled = false}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>(
    "unready",
    log_,
    RecordingProcessor::Behaviour{.notReadyReason = "rates not loaded"}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));

  auto const record = engine->runTick();

  EXPECT_TRUE(record.success);
  EXPECT_EQ(log_->callOrder, (std::vector<std::string>{"banking"}));
  EXPECT_EQ(record.processorsRun, (std::vector<std::string>{"banking"}));
}

TEST_F(TickEngineTest, RegisterProcessor_InvalidRejected)
{
  auto engine = makeEngine();
  EXPECT_THROW(engine->registerProcessor(nullptr), std::invalid_argument);

  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  EXPECT_THROW(engine->registerProcessor(
                 std::make_unique<RecordingProcessor>("banking", log_)),
               std::invalid_argument);
}

TEST_F(TickEngineTest, RegisterProcessor_DuringTick_WaitsForRunningProcessors)
{
  auto engine = makeEngine();
  std::promise<void> entered;
  std::atomic<bool> finished{false};
  engine->registerProcessor(std::make_unique<GateProcessor>(entered, finished));

  TickRecord first{};
  std::jthread ticking{[&]() { first = engine->runTick(); }};
  entered.get_future().wait();

  engine->registerProcessor(std::make_unique<RecordingProcessor>("late", log_));
  EXPECT_TRUE(finished.load());

  ticking.join();
  EXPECT_TRUE(first.success);
  EXPECT_EQ(log_->calls, 0U);

  engine->runTick();
  EXPECT_EQ(log_->calls, 1U);
}

TEST_F(TickEngineTest, Constructor_InvalidConfig_Throws)
{
  auto config = makeConfig();
  config.batchSize = 0;
  EXPECT_THROW(makeEngine(config), std::invalid_argument);

  config = makeConfig();
  config.workerThreads = 0;
  EXPECT_THROW(makeEngine(config), std::invalid_argument);
}

// ========== Batching ==========

TEST_F(TickEngineTest, WorkerThreads_EveryPlayerProcessedExactlyOnce)
{
  auto config = makeConfig();
  config.batchSize = 2;
  config.workerThreads = 4;
  auto engine = makeEngine(config);
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));

  std::vector<std::string> players;
  for (int i = 0; i < 9; ++i)
  {
    players.push_back("player-" + std::to_string(i));
    engine->registerPlayer(players.back());
  }

  auto const record = engine->runTick();

  EXPECT_TRUE(record.success);
  EXPECT_EQ(record.totalItemsProcessed, 9U);
  EXPECT_EQ(log_->calls, 5U);
  for (const auto& player : players)
  {
    EXPECT_EQ(countOf(log_->playersSeen, player), 1U) << player;
    EXPECT_EQ(engine->getTracker().find(player)->lastProcessedTick,
              GameTime::start());
  }
}

// ========== Scheduler interaction ==========

TEST_F(TickEngineTest, RunTick_WhileAnotherRunning_ThrowsConcurrent)
{
  auto engine = makeEngine();
  engine->getScheduler().recordTick(
    "external", GameTime::start(), TickTrigger::Manual);

  EXPECT_THROW(engine->runTick(), ConcurrentTickError);
  EXPECT_EQ(engine->getScheduler().history().size(), 1U);
}

TEST_F(TickEngineTest, RunTick_RecoversStuckTickFirst)
{
  auto engine = makeEngine();
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->getScheduler().recordTick(
    "tick-000001", GameTime::start(), TickTrigger::Scheduled);
  clock_.advance(std::chrono::minutes{10});

  auto const record = engine->runTick();

  EXPECT_EQ(record.gameTime.totalMonths, 2U);
  auto const history = engine->getScheduler().history();
  ASSERT_EQ(history.size(), 2U);
  EXPECT_EQ(history[0].status(), TickStatus::Failed);
  EXPECT_TRUE(history[0].result->timedOut);
}

TEST_F(TickEngineTest, ForceCompleteTick_ThenRunContinues)
{
  auto engine = makeEngine();
  engine->getScheduler().recordTick(
    "tick-000001", GameTime::start(), TickTrigger::Scheduled);

  auto const forced = engine->forceCompleteTick("tick-000001", "operator");
  EXPECT_TRUE(forced.result->forcedByOperator);
  EXPECT_EQ(engine->runTick().gameTime.totalMonths, 2U);
}

TEST_F(TickEngineTest, TimeoutDuringTick_RemainingProcessorsSkipped)
{
  auto engine = makeEngine();
  engine->registerProcessor(
    std::make_unique<SlowProcessor>(clock_, std::chrono::minutes{6}));
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");

  auto const record = engine->runTick();

  EXPECT_FALSE(record.success);
  ASSERT_TRUE(record.result.has_value());
  EXPECT_TRUE(record.result->timedOut);
  EXPECT_EQ(record.processorsRun, (std::vector<std::string>{"slow"}));
  EXPECT_EQ(log_->calls, 0U);
  EXPECT_FALSE(engine->getScheduler().getActiveTick().has_value());
}

// ========== advanceTo ==========

TEST_F(TickEngineTest, AdvanceTo_SingleCatchupTickForGap)
{
  auto config = makeConfig();
  config.schedule = TickSchedule{clock_.now(), std::chrono::hours{1}};
  auto engine = makeEngine(config);
  engine->registerProcessor(std::make_unique<RecordingProcessor>("banking", log_));
  engine->registerPlayer("alice");
  auto const epoch = clock_.now();

  auto const first = engine->advanceTo(epoch);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->triggeredBy, TickTrigger::Scheduled);
  EXPECT_EQ(first->gameTime.totalMonths, 1U);

  EXPECT_FALSE(engine->advanceTo(epoch + std::chrono::minutes{30}).has_value());

  auto const catchup = engine->advanceTo(epoch + std::chrono::hours{5});
  ASSERT_TRUE(catchup.has_value());
  EXPECT_EQ(catchup->triggeredBy, TickTrigger::Catchup);
  EXPECT_EQ(catchup->gameTime.totalMonths, 6U);
  EXPECT_EQ(engine->getScheduler().history().size(), 2U);
  EXPECT_EQ(engine->getTracker().find("alice")->lastProcessedTick.totalMonths, 6U);

  auto const next = engine->advanceTo(epoch + std::chrono::hours{6});
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->triggeredBy, TickTrigger::Scheduled);
  EXPECT_EQ(next->gameTime.totalMonths, 7U);
}

TEST_F(TickEngineTest, AdvanceTo_WithoutSchedule_Throws)
{
  auto engine = makeEngine();
  EXPECT_THROW(engine->advanceTo(clock_.now()), std::runtime_error);
}

// ========== State and snapshots ==========

TEST_F(TickEngineTest, State_ReportsProgress)
{
  const TickEngine* engineView = nullptr;
  auto engine = makeEngine();
  engineView = engine.get();
  auto watcher = std::make_unique<StateWatchProcessor>(engineView);
  auto* watcherView = watcher.get();
  engine->registerProcessor(std::move(watcher));

  auto const idle = engine->state();
  EXPECT_FALSE(idle.isProcessing);
  EXPECT_FALSE(idle.lastTick.has_value());
  EXPECT_EQ(idle.ticksProcessed, 0U);

  auto const record = engine->runTick();

  EXPECT_TRUE(watcherView->observed.isProcessing);
  EXPECT_EQ(watcherView->observed.currentProcessor.value_or(""), "watcher");

  auto const after = engine->state();
  EXPECT_FALSE(after.isProcessing);
  EXPECT_FALSE(after.currentProcessor.has_value());
  EXPECT_EQ(after.ticksProcessed, 1U);
  ASSERT_TRUE(after.lastTick.has_value());
  EXPECT_EQ(*after.lastTick, record.gameTime);
  EXPECT_EQ(after.lastTickAt, record.completedAt);
}

TEST_F(TickEngineTest, OfflineSnapshot_ConsumedOnce)
{
  auto engine = makeEngine();

  OfflineSnapshot snapshot{};
  snapshot.playerId = "alice";
  snapshot.capturedAtWeek = 3;
  snapshot.influence = 10.0;
  engine->captureOfflineSnapshot(snapshot);

  auto const consumed = engine->consumeOfflineSnapshot("alice");
  ASSERT_TRUE(consumed.has_value());
  EXPECT_EQ(consumed->capturedAtWeek, 3U);
  EXPECT_FALSE(engine->consumeOfflineSnapshot("alice").has_value());
  EXPECT_TRUE(store_.loadOfflineSnapshots().empty());
}

}  // namespace test
}  // namespace civic_sim
