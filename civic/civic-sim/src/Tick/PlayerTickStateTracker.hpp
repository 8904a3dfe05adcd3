// Ticket: 0002_player_tick_state

#ifndef CIVIC_SIM_TICK_PLAYER_TICK_STATE_TRACKER_HPP
#define CIVIC_SIM_TICK_PLAYER_TICK_STATE_TRACKER_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "civic-sim/src/DataTypes/GameTime.hpp"
#include "civic-sim/src/Persistence/TickStore.hpp"
#include "civic-sim/src/Tick/PlayerTickState.hpp"

namespace civic_sim
{

/**
 * @brief Per-player work queue for catch-up processing
 *
 * Owns the authoritative PlayerTickState map, loaded from the store once at
 * construction and written through on every change. Every update is a
 * compare-and-set under the internal mutex, so concurrent batches of a tick
 * never move a player backward.
 *
 * @ticket 0002_player_tick_state
 */
class PlayerTickStateTracker
{
public:
  using Clock = std::function<WallClock::time_point()>;

  /**
   * @param store Persistence, must outlive the tracker
   * @param clock Wall clock for lastProcessedAt (defaults to system_clock)
   * @throws std::runtime_error if the store cannot be read
   */
  explicit PlayerTickStateTracker(TickStore& store, Clock clock = {});

  PlayerTickStateTracker(const PlayerTickStateTracker&) = delete;
  PlayerTickStateTracker& operator=(const PlayerTickStateTracker&) = delete;

  /**
   * @brief Existing state, or a new one at the zero sentinel
   *
   * A newly created player is persisted immediately.
   * @throws ValidationError if playerId is empty
   */
  PlayerTickState getOrCreate(const std::string& playerId);

  /**
   * @brief Record that `system` processed the player at `gameTime`
   *
   * Idempotent: re-marking the same or an older time is a no-op. Both the
   * player's overall lastProcessedTick and the system's entry move forward
   * only.
   *
   * @return true if the state advanced
   * @throws ValidationError if gameTime is malformed or zero
   */
  bool markProcessed(const std::string& playerId,
                     const GameTime& gameTime,
                     std::string_view system);

  /**
   * @brief Players whose lastProcessedTick precedes gameTime, sorted by id
   */
  std::vector<std::string> getUnprocessedPlayers(const GameTime& gameTime) const;

  /// @brief Every tracked player, sorted by id
  std::vector<std::string> playerIds() const;

  std::optional<PlayerTickState> find(const std::string& playerId) const;

  size_t size() const;

private:
  TickStore& store_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, PlayerTickState> players_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_PLAYER_TICK_STATE_TRACKER_HPP
