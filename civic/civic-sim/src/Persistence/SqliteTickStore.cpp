// Ticket: 0005_sqlite_tick_store

#include "civic-sim/src/Persistence/SqliteTickStore.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <cpp_sqlite/src/utils/Logger.hpp>

#include "civic-transfer/src/OfflineSnapshotRecord.hpp"
#include "civic-transfer/src/PlayerTickProgressRecord.hpp"
#include "civic-transfer/src/ProcessorRunRecord.hpp"
#include "civic-transfer/src/TickCompletionRecord.hpp"
#include "civic-transfer/src/TickStartRecord.hpp"

namespace civic_sim
{

namespace
{

double toEpochSeconds(WallClock::time_point time)
{
  return std::chrono::duration_cast<std::chrono::duration<double>>(
           time.time_since_epoch())
    .count();
}

WallClock::time_point fromEpochSeconds(double seconds)
{
  return WallClock::time_point{std::chrono::duration_cast<WallClock::duration>(
    std::chrono::duration<double>{seconds})};
}

GameTime toGameTime(uint32_t year, uint32_t month, uint32_t totalMonths)
{
  return GameTime{year, month, totalMonths};
}

}  // namespace

SqliteTickStore::SqliteTickStore(const std::string& databasePath)
{
  auto& logger = cpp_sqlite::Logger::getInstance();
  database_ = std::make_unique<cpp_sqlite::Database>(
    databasePath, true, logger.getLogger());

  // Parent tables first (FK integrity)
  database_->getDAO<civic_transfer::TickStartRecord>();
  database_->getDAO<civic_transfer::TickCompletionRecord>();
  database_->getDAO<civic_transfer::ProcessorRunRecord>();
  database_->getDAO<civic_transfer::TickErrorRecord>();
  database_->getDAO<civic_transfer::ProcessorSummaryRecord>();
  database_->getDAO<civic_transfer::PlayerTickProgressRecord>();
  database_->getDAO<civic_transfer::OfflineSnapshotRecord>();
  database_->getDAO<civic_transfer::OfflineSnapshotConsumedRecord>();

  loadIdCaches();
}

void SqliteTickStore::loadIdCaches()
{
  for (const auto& start :
       database_->getDAO<civic_transfer::TickStartRecord>().selectAll())
  {
    tickStartIds_[start.tick_id] = start.id;
  }
  for (const auto& completion :
       database_->getDAO<civic_transfer::TickCompletionRecord>().selectAll())
  {
    completedStartIds_.insert(completion.tick.id);
  }

  std::set<uint32_t> consumed;
  for (const auto& marker :
       database_->getDAO<civic_transfer::OfflineSnapshotConsumedRecord>()
         .selectAll())
  {
    consumed.insert(marker.snapshot.id);
  }
  for (const auto& snapshot :
       database_->getDAO<civic_transfer::OfflineSnapshotRecord>().selectAll())
  {
    if (consumed.contains(snapshot.id))
    {
      continue;
    }
    // Newest capture per player is the live one
    auto& liveId = liveSnapshotIds_[snapshot.player_id];
    liveId = std::max(liveId, snapshot.id);
  }
}

// ========== Tick records ==========

std::vector<TickRecord> SqliteTickStore::loadTickRecords()
{
  std::scoped_lock lock{mutex_};

  auto starts =
    database_->getDAO<civic_transfer::TickStartRecord>().selectAll();
  auto const completions =
    database_->getDAO<civic_transfer::TickCompletionRecord>().selectAll();
  auto runs =
    database_->getDAO<civic_transfer::ProcessorRunRecord>().selectAll();
  auto const errors =
    database_->getDAO<civic_transfer::TickErrorRecord>().selectAll();
  auto const summaries =
    database_->getDAO<civic_transfer::ProcessorSummaryRecord>().selectAll();

  std::ranges::sort(starts, {}, &civic_transfer::TickStartRecord::id);
  std::ranges::sort(runs, {}, &civic_transfer::ProcessorRunRecord::run_order);

  std::vector<TickRecord> records;
  records.reserve(starts.size());
  std::map<uint32_t, size_t> indexByStartId;

  for (const auto& start : starts)
  {
    TickRecord record{};
    record.tickId = start.tick_id;
    record.gameTime = toGameTime(start.year, start.month, start.total_months);
    record.triggeredBy = static_cast<TickTrigger>(start.triggered_by);
    if (!start.triggered_by_user_id.empty())
    {
      record.triggeredByUserId = start.triggered_by_user_id;
    }
    record.startedAt = fromEpochSeconds(start.started_at);
    indexByStartId[start.id] = records.size();
    records.push_back(std::move(record));
  }

  for (const auto& completion : completions)
  {
    auto const it = indexByStartId.find(completion.tick.id);
    if (it == indexByStartId.end())
    {
      throw std::runtime_error{"TickCompletionRecord " +
                               std::to_string(completion.id) +
                               " references a missing tick"};
    }
    TickRecord& record = records[it->second];
    record.completedAt = fromEpochSeconds(completion.completed_at);
    record.durationMs = completion.duration_ms;
    record.success = completion.success != 0;
    record.totalItemsProcessed = completion.total_items_processed;
    record.totalErrors = completion.total_errors;

    TickResult result{};
    result.timedOut = completion.timed_out != 0;
    result.forcedByOperator = completion.forced_by_operator != 0;
    result.failureReason = completion.failure_reason;
    record.result = std::move(result);
  }

  for (const auto& run : runs)
  {
    auto const it = indexByStartId.find(run.tick.id);
    if (it == indexByStartId.end() || !records[it->second].result)
    {
      continue;
    }
    TickRecord& record = records[it->second];

    TickProcessorResult processorResult{};
    processorResult.processor = run.processor;
    processorResult.success = run.success != 0;
    processorResult.itemsProcessed = run.items_processed;
    processorResult.durationMs = run.duration_ms;
    for (const auto& error : errors)
    {
      if (error.tick.id == run.tick.id && error.processor == run.processor)
      {
        processorResult.errors.push_back(TickError{error.entity_id,
                                                   error.entity_type,
                                                   error.message,
                                                   error.recoverable != 0});
      }
    }
    for (const auto& entry : summaries)
    {
      if (entry.run.id == run.id)
      {
        processorResult.summary[entry.key] = entry.value;
      }
    }
    record.processorsRun.push_back(run.processor);
    record.result->processors.push_back(std::move(processorResult));
  }

  return records;
}

void SqliteTickStore::saveTickStart(const TickRecord& record)
{
  std::scoped_lock lock{mutex_};

  if (tickStartIds_.contains(record.tickId))
  {
    throw std::runtime_error{"Tick '" + record.tickId + "' already stored"};
  }

  civic_transfer::TickStartRecord start{};
  start.tick_id = record.tickId;
  start.year = record.gameTime.year;
  start.month = record.gameTime.month;
  start.total_months = record.gameTime.totalMonths;
  start.triggered_by = static_cast<uint32_t>(record.triggeredBy);
  start.triggered_by_user_id = record.triggeredByUserId.value_or("");
  start.started_at = toEpochSeconds(record.startedAt);

  database_->getDAO<civic_transfer::TickStartRecord>().insert(start);
  tickStartIds_[record.tickId] = start.id;
}

void SqliteTickStore::saveTickCompletion(const TickRecord& record)
{
  std::scoped_lock lock{mutex_};

  auto const it = tickStartIds_.find(record.tickId);
  if (it == tickStartIds_.end())
  {
    throw std::runtime_error{"Tick '" + record.tickId + "' was never started"};
  }
  uint32_t const startId = it->second;
  if (completedStartIds_.contains(startId))
  {
    throw std::runtime_error{"Tick '" + record.tickId +
                             "' is already completed"};
  }
  if (!record.completedAt)
  {
    throw std::runtime_error{"Tick '" + record.tickId +
                             "' has no completion time"};
  }

  database_->withTransaction(
    [&]()
    {
      civic_transfer::TickCompletionRecord completion{};
      completion.completed_at = toEpochSeconds(*record.completedAt);
      completion.duration_ms = record.durationMs.value_or(0.0);
      completion.success = record.success ? 1U : 0U;
      completion.total_items_processed = record.totalItemsProcessed;
      completion.total_errors = record.totalErrors;
      if (record.result)
      {
        completion.timed_out = record.result->timedOut ? 1U : 0U;
        completion.forced_by_operator =
          record.result->forcedByOperator ? 1U : 0U;
        completion.failure_reason = record.result->failureReason;
      }
      completion.tick.id = startId;
      database_->getDAO<civic_transfer::TickCompletionRecord>().insert(
        completion);

      if (!record.result)
      {
        return;
      }

      auto& runDAO = database_->getDAO<civic_transfer::ProcessorRunRecord>();
      auto& errorDAO = database_->getDAO<civic_transfer::TickErrorRecord>();
      auto& summaryDAO =
        database_->getDAO<civic_transfer::ProcessorSummaryRecord>();
      uint32_t runOrder = 0;
      for (const auto& processorResult : record.result->processors)
      {
        civic_transfer::ProcessorRunRecord run{};
        run.processor = processorResult.processor;
        run.run_order = runOrder++;
        run.success = processorResult.success ? 1U : 0U;
        run.items_processed = processorResult.itemsProcessed;
        run.duration_ms = processorResult.durationMs;
        run.tick.id = startId;
        runDAO.insert(run);

        for (const auto& [key, value] : processorResult.summary)
        {
          civic_transfer::ProcessorSummaryRecord entry{};
          entry.key = key;
          entry.value = value;
          entry.run.id = run.id;
          summaryDAO.insert(entry);
        }

        for (const auto& error : processorResult.errors)
        {
          civic_transfer::TickErrorRecord errorRecord{};
          errorRecord.processor = processorResult.processor;
          errorRecord.entity_id = error.entityId;
          errorRecord.entity_type = error.entityType;
          errorRecord.message = error.message;
          errorRecord.recoverable = error.recoverable ? 1U : 0U;
          errorRecord.tick.id = startId;
          errorDAO.insert(errorRecord);
        }
      }
    });

  completedStartIds_.insert(startId);
}

// ========== Player tick state ==========

std::vector<PlayerTickState> SqliteTickStore::loadPlayerTickStates()
{
  std::scoped_lock lock{mutex_};

  auto const progress =
    database_->getDAO<civic_transfer::PlayerTickProgressRecord>().selectAll();

  std::map<std::string, PlayerTickState> states;
  for (const auto& entry : progress)
  {
    auto [it, inserted] = states.try_emplace(entry.player_id);
    PlayerTickState& state = it->second;
    if (inserted)
    {
      state.playerId = entry.player_id;
      state.lastProcessedAt = fromEpochSeconds(entry.processed_at);
    }

    GameTime const time =
      toGameTime(entry.year, entry.month, entry.total_months);
    if (time > state.lastProcessedTick)
    {
      state.lastProcessedTick = time;
      state.lastProcessedAt = fromEpochSeconds(entry.processed_at);
    }

    if (entry.system.empty())
    {
      continue;  // Registration entry, no system progress
    }
    auto& system = state.perSystemState[entry.system];
    if (time >= system.lastProcessed)
    {
      system.lastProcessed = time;
      system.counters["processed"] =
        std::max(system.counters["processed"], entry.processed_count);
    }
  }

  std::vector<PlayerTickState> result;
  result.reserve(states.size());
  for (auto& [playerId, state] : states)
  {
    result.push_back(std::move(state));
  }
  return result;
}

void SqliteTickStore::upsertPlayerTickState(const PlayerTickState& state,
                                            const std::string& system)
{
  std::scoped_lock lock{mutex_};

  civic_transfer::PlayerTickProgressRecord entry{};
  entry.player_id = state.playerId;
  entry.system = system;
  entry.processed_at = toEpochSeconds(state.lastProcessedAt);

  GameTime time = state.lastProcessedTick;
  auto const systemIt = state.perSystemState.find(system);
  if (systemIt != state.perSystemState.end())
  {
    time = systemIt->second.lastProcessed;
    auto const counterIt = systemIt->second.counters.find("processed");
    if (counterIt != systemIt->second.counters.end())
    {
      entry.processed_count = counterIt->second;
    }
  }
  entry.year = time.year;
  entry.month = time.month;
  entry.total_months = time.totalMonths;

  database_->getDAO<civic_transfer::PlayerTickProgressRecord>().insert(entry);
}

// ========== Offline snapshots ==========

std::vector<OfflineSnapshot> SqliteTickStore::loadOfflineSnapshots()
{
  std::scoped_lock lock{mutex_};

  auto& dao = database_->getDAO<civic_transfer::OfflineSnapshotRecord>();
  std::vector<OfflineSnapshot> snapshots;
  snapshots.reserve(liveSnapshotIds_.size());
  for (const auto& [playerId, recordId] : liveSnapshotIds_)
  {
    auto const record = dao.selectById(recordId);
    if (!record.has_value())
    {
      throw std::runtime_error{"OfflineSnapshotRecord " +
                               std::to_string(recordId) + " is missing"};
    }

    OfflineSnapshot snapshot{};
    snapshot.playerId = record->player_id;
    snapshot.capturedAtWeek = record->captured_at_week;
    snapshot.influence = record->influence;
    if (record->has_approval_rating != 0)
    {
      snapshot.approvalRating = record->approval_rating;
    }
    snapshot.autopilotStrategy =
      static_cast<AutopilotStrategy>(record->autopilot_strategy);
    snapshots.push_back(std::move(snapshot));
  }
  return snapshots;
}

void SqliteTickStore::saveOfflineSnapshot(const OfflineSnapshot& snapshot)
{
  std::scoped_lock lock{mutex_};

  database_->withTransaction(
    [&]()
    {
      auto const previous = liveSnapshotIds_.find(snapshot.playerId);
      if (previous != liveSnapshotIds_.end())
      {
        markSnapshotConsumed(previous->second);
      }

      civic_transfer::OfflineSnapshotRecord record{};
      record.player_id = snapshot.playerId;
      record.captured_at_week = snapshot.capturedAtWeek;
      record.influence = snapshot.influence;
      if (snapshot.approvalRating)
      {
        record.approval_rating = *snapshot.approvalRating;
        record.has_approval_rating = 1;
      }
      record.autopilot_strategy =
        static_cast<uint32_t>(snapshot.autopilotStrategy);
      database_->getDAO<civic_transfer::OfflineSnapshotRecord>().insert(
        record);
      liveSnapshotIds_[snapshot.playerId] = record.id;
    });
}

void SqliteTickStore::discardOfflineSnapshot(const std::string& playerId)
{
  std::scoped_lock lock{mutex_};

  auto const it = liveSnapshotIds_.find(playerId);
  if (it == liveSnapshotIds_.end())
  {
    return;
  }
  markSnapshotConsumed(it->second);
  liveSnapshotIds_.erase(it);
}

void SqliteTickStore::markSnapshotConsumed(uint32_t snapshotRecordId)
{
  civic_transfer::OfflineSnapshotConsumedRecord marker{};
  marker.consumed_at = toEpochSeconds(WallClock::now());
  marker.snapshot.id = snapshotRecordId;
  database_->getDAO<civic_transfer::OfflineSnapshotConsumedRecord>().insert(
    marker);
}

const cpp_sqlite::Database& SqliteTickStore::getDatabase() const
{
  return *database_;
}

}  // namespace civic_sim
