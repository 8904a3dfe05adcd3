// Ticket: 0004_offline_protection

#ifndef CIVIC_SIM_OFFLINE_OFFLINE_SNAPSHOT_REGISTRY_HPP
#define CIVIC_SIM_OFFLINE_OFFLINE_SNAPSHOT_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "civic-sim/src/Offline/OfflineProtection.hpp"
#include "civic-sim/src/Persistence/TickStore.hpp"

namespace civic_sim
{

/**
 * @brief Lifecycle of offline snapshots: captured at logout, consumed once
 *
 * At most one live snapshot per player; capturing again replaces an
 * unconsumed one. Thread-safe.
 *
 * @ticket 0004_offline_protection
 */
class OfflineSnapshotRegistry
{
public:
  /**
   * @param store Persistence, must outlive the registry
   * @throws std::runtime_error if the store cannot be read
   */
  explicit OfflineSnapshotRegistry(TickStore& store);

  OfflineSnapshotRegistry(const OfflineSnapshotRegistry&) = delete;
  OfflineSnapshotRegistry& operator=(const OfflineSnapshotRegistry&) = delete;

  /**
   * @brief Store the snapshot taken when the player's session ended
   * @throws ValidationError if playerId is empty, influence or approval is
   *         non-finite
   */
  void capture(const OfflineSnapshot& snapshot);

  /**
   * @brief Hand out the player's snapshot and discard it
   * @return The snapshot, or std::nullopt if none is live
   */
  std::optional<OfflineSnapshot> consume(const std::string& playerId);

  bool contains(const std::string& playerId) const;

  size_t size() const;

private:
  TickStore& store_;
  mutable std::mutex mutex_;
  std::map<std::string, OfflineSnapshot> snapshots_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_OFFLINE_OFFLINE_SNAPSHOT_REGISTRY_HPP
