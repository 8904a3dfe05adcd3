#include "civic-sim/src/Persistence/MemoryTickStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace civic_sim
{

std::vector<TickRecord> MemoryTickStore::loadTickRecords()
{
  std::scoped_lock lock{mutex_};
  return ticks_;
}

void MemoryTickStore::saveTickStart(const TickRecord& record)
{
  std::scoped_lock lock{mutex_};
  auto const duplicate =
    std::ranges::any_of(ticks_,
                        [&](const TickRecord& existing)
                        { return existing.tickId == record.tickId; });
  if (duplicate)
  {
    throw std::runtime_error{"Tick '" + record.tickId + "' already stored"};
  }
  ticks_.push_back(record);
}

void MemoryTickStore::saveTickCompletion(const TickRecord& record)
{
  std::scoped_lock lock{mutex_};
  auto it = std::ranges::find_if(ticks_,
                                 [&](const TickRecord& existing)
                                 { return existing.tickId == record.tickId; });
  if (it == ticks_.end())
  {
    throw std::runtime_error{"Tick '" + record.tickId + "' was never started"};
  }
  if (!it->isRunning())
  {
    throw std::runtime_error{"Tick '" + record.tickId +
                             "' is already completed"};
  }
  *it = record;
}

std::vector<PlayerTickState> MemoryTickStore::loadPlayerTickStates()
{
  std::scoped_lock lock{mutex_};
  std::vector<PlayerTickState> states;
  states.reserve(players_.size());
  for (const auto& [playerId, state] : players_)
  {
    states.push_back(state);
  }
  return states;
}

void MemoryTickStore::upsertPlayerTickState(const PlayerTickState& state,
                                            const std::string& system)
{
  std::scoped_lock lock{mutex_};
  auto [it, inserted] = players_.try_emplace(state.playerId, state);
  if (inserted)
  {
    return;
  }

  // Ordering guard: only newer progress replaces stored progress
  PlayerTickState& stored = it->second;
  if (state.lastProcessedTick > stored.lastProcessedTick)
  {
    stored.lastProcessedTick = state.lastProcessedTick;
    stored.lastProcessedAt = state.lastProcessedAt;
  }
  auto const incoming = state.perSystemState.find(system);
  if (incoming == state.perSystemState.end())
  {
    return;
  }
  auto& storedSystem = stored.perSystemState[system];
  if (incoming->second.lastProcessed >= storedSystem.lastProcessed)
  {
    storedSystem = incoming->second;
  }
}

std::vector<OfflineSnapshot> MemoryTickStore::loadOfflineSnapshots()
{
  std::scoped_lock lock{mutex_};
  std::vector<OfflineSnapshot> snapshots;
  snapshots.reserve(snapshots_.size());
  for (const auto& [playerId, snapshot] : snapshots_)
  {
    snapshots.push_back(snapshot);
  }
  return snapshots;
}

void MemoryTickStore::saveOfflineSnapshot(const OfflineSnapshot& snapshot)
{
  std::scoped_lock lock{mutex_};
  snapshots_[snapshot.playerId] = snapshot;
}

void MemoryTickStore::discardOfflineSnapshot(const std::string& playerId)
{
  std::scoped_lock lock{mutex_};
  snapshots_.erase(playerId);
}

}  // namespace civic_sim
