// Ticket: 0005_sqlite_tick_store

#ifndef CIVIC_SIM_PERSISTENCE_TICK_STORE_HPP
#define CIVIC_SIM_PERSISTENCE_TICK_STORE_HPP

#include <string>
#include <vector>

#include "civic-sim/src/Offline/OfflineProtection.hpp"
#include "civic-sim/src/Tick/PlayerTickState.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"

namespace civic_sim
{

/**
 * @brief Narrow repository for the tick core's persisted state
 *
 * Injected at the boundary: the scheduler, tracker and snapshot registry keep
 * their authoritative in-memory view and write through to the store. The
 * store is read once at startup.
 *
 * Implementations must be safe to call from multiple threads.
 * Failures are reported as std::runtime_error.
 *
 * @ticket 0005_sqlite_tick_store
 */
class TickStore
{
public:
  virtual ~TickStore() = default;

  /// @brief Every tick, in start order, Running ones included
  virtual std::vector<TickRecord> loadTickRecords() = 0;

  /// @brief Persist a tick entering the Running state
  virtual void saveTickStart(const TickRecord& record) = 0;

  /// @brief Persist the single completion of a tick
  virtual void saveTickCompletion(const TickRecord& record) = 0;

  virtual std::vector<PlayerTickState> loadPlayerTickStates() = 0;

  /**
   * @brief Persist the player's state after `system` advanced it
   *
   * Implementations keep the newest progress per (player, system) and must
   * never regress a stored state when writes arrive out of order.
   */
  virtual void upsertPlayerTickState(const PlayerTickState& state,
                                     const std::string& system) = 0;

  /// @brief Live (unconsumed) snapshots
  virtual std::vector<OfflineSnapshot> loadOfflineSnapshots() = 0;

  /// @brief Store a snapshot, superseding any live one for the player
  virtual void saveOfflineSnapshot(const OfflineSnapshot& snapshot) = 0;

  /// @brief Mark the player's live snapshot consumed
  virtual void discardOfflineSnapshot(const std::string& playerId) = 0;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_PERSISTENCE_TICK_STORE_HPP
