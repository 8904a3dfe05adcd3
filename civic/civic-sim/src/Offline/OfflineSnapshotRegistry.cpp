// Ticket: 0004_offline_protection

#include "civic-sim/src/Offline/OfflineSnapshotRegistry.hpp"

#include <cmath>

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

OfflineSnapshotRegistry::OfflineSnapshotRegistry(TickStore& store)
  : store_{store}
{
  for (auto& snapshot : store_.loadOfflineSnapshots())
  {
    std::string playerId = snapshot.playerId;
    snapshots_.insert_or_assign(std::move(playerId), std::move(snapshot));
  }
}

void OfflineSnapshotRegistry::capture(const OfflineSnapshot& snapshot)
{
  if (snapshot.playerId.empty())
  {
    throw ValidationError{"Offline snapshot needs a player id"};
  }
  if (!std::isfinite(snapshot.influence))
  {
    throw ValidationError{"Offline snapshot influence must be finite"};
  }
  if (snapshot.approvalRating && !std::isfinite(*snapshot.approvalRating))
  {
    throw ValidationError{"Offline snapshot approval rating must be finite"};
  }

  std::scoped_lock lock{mutex_};
  store_.saveOfflineSnapshot(snapshot);
  snapshots_.insert_or_assign(snapshot.playerId, snapshot);
}

std::optional<OfflineSnapshot> OfflineSnapshotRegistry::consume(
  const std::string& playerId)
{
  std::scoped_lock lock{mutex_};
  auto it = snapshots_.find(playerId);
  if (it == snapshots_.end())
  {
    return std::nullopt;
  }

  store_.discardOfflineSnapshot(playerId);
  OfflineSnapshot snapshot = std::move(it->second);
  snapshots_.erase(it);
  return snapshot;
}

bool OfflineSnapshotRegistry::contains(const std::string& playerId) const
{
  std::scoped_lock lock{mutex_};
  return snapshots_.contains(playerId);
}

size_t OfflineSnapshotRegistry::size() const
{
  std::scoped_lock lock{mutex_};
  return snapshots_.size();
}

}  // namespace civic_sim
