// Ticket: 0002_player_tick_state

#include "civic-sim/src/Tick/PlayerTickStateTracker.hpp"

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

PlayerTickStateTracker::PlayerTickStateTracker(TickStore& store, Clock clock)
  : store_{store}, clock_{std::move(clock)}
{
  if (!clock_)
  {
    clock_ = []() { return WallClock::now(); };
  }

  for (auto& state : store_.loadPlayerTickStates())
  {
    std::string playerId = state.playerId;
    players_.insert_or_assign(std::move(playerId), std::move(state));
  }
}

PlayerTickState PlayerTickStateTracker::getOrCreate(const std::string& playerId)
{
  if (playerId.empty())
  {
    throw ValidationError{"Player id must not be empty"};
  }

  std::scoped_lock lock{mutex_};

  auto const it = players_.find(playerId);
  if (it != players_.end())
  {
    return it->second;
  }

  PlayerTickState state{};
  state.playerId = playerId;
  state.lastProcessedTick = GameTime::zero();
  state.lastProcessedAt = clock_();

  // Registration entry carries no system
  store_.upsertPlayerTickState(state, "");
  players_.emplace(playerId, state);
  return state;
}

bool PlayerTickStateTracker::markProcessed(const std::string& playerId,
                                           const GameTime& gameTime,
                                           std::string_view system)
{
  gameTime.validate();
  if (gameTime.isZero())
  {
    throw ValidationError{"Cannot mark player '" + playerId +
                          "' processed at the zero game time"};
  }
  if (system.empty())
  {
    throw ValidationError{"System name must not be empty"};
  }

  std::scoped_lock lock{mutex_};

  std::string const systemKey{system};

  PlayerTickState updated{};
  updated.playerId = playerId;
  auto const it = players_.find(playerId);
  if (it != players_.end())
  {
    auto const systemIt = it->second.perSystemState.find(systemKey);
    if (systemIt != it->second.perSystemState.end() &&
        gameTime <= systemIt->second.lastProcessed)
    {
      return false;
    }
    // Mutate a copy so a store failure leaves the in-memory view untouched
    updated = it->second;
  }

  auto& updatedSystem = updated.perSystemState[systemKey];
  updatedSystem.lastProcessed = gameTime;
  ++updatedSystem.counters["processed"];
  if (gameTime > updated.lastProcessedTick)
  {
    updated.lastProcessedTick = gameTime;
  }
  updated.lastProcessedAt = clock_();

  store_.upsertPlayerTickState(updated, systemKey);
  players_.insert_or_assign(playerId, std::move(updated));
  return true;
}

std::vector<std::string> PlayerTickStateTracker::getUnprocessedPlayers(
  const GameTime& gameTime) const
{
  std::scoped_lock lock{mutex_};

  // std::map iteration keeps the result sorted by id
  std::vector<std::string> lagging;
  for (const auto& [playerId, state] : players_)
  {
    if (state.lastProcessedTick < gameTime)
    {
      lagging.push_back(playerId);
    }
  }
  return lagging;
}

std::vector<std::string> PlayerTickStateTracker::playerIds() const
{
  std::scoped_lock lock{mutex_};
  std::vector<std::string> ids;
  ids.reserve(players_.size());
  for (const auto& [playerId, state] : players_)
  {
    ids.push_back(playerId);
  }
  return ids;
}

std::optional<PlayerTickState> PlayerTickStateTracker::find(
  const std::string& playerId) const
{
  std::scoped_lock lock{mutex_};
  auto const it = players_.find(playerId);
  if (it == players_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

size_t PlayerTickStateTracker::size() const
{
  std::scoped_lock lock{mutex_};
  return players_.size();
}

}  // namespace civic_sim
