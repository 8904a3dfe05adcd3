#ifndef CIVIC_SIM_PERSISTENCE_MEMORY_TICK_STORE_HPP
#define CIVIC_SIM_PERSISTENCE_MEMORY_TICK_STORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "civic-sim/src/Persistence/TickStore.hpp"

namespace civic_sim
{

/**
 * @brief Process-local TickStore
 *
 * Used by tests and by ephemeral runs of the command-line tool. Contents are
 * lost when the object is destroyed.
 */
class MemoryTickStore final : public TickStore
{
public:
  MemoryTickStore() = default;

  std::vector<TickRecord> loadTickRecords() override;
  void saveTickStart(const TickRecord& record) override;
  void saveTickCompletion(const TickRecord& record) override;

  std::vector<PlayerTickState> loadPlayerTickStates() override;
  void upsertPlayerTickState(const PlayerTickState& state,
                             const std::string& system) override;

  std::vector<OfflineSnapshot> loadOfflineSnapshots() override;
  void saveOfflineSnapshot(const OfflineSnapshot& snapshot) override;
  void discardOfflineSnapshot(const std::string& playerId) override;

private:
  mutable std::mutex mutex_;
  std::vector<TickRecord> ticks_;
  std::map<std::string, PlayerTickState> players_;
  std::map<std::string, OfflineSnapshot> snapshots_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_PERSISTENCE_MEMORY_TICK_STORE_HPP
