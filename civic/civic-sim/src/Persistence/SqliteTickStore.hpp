// Ticket: 0005_sqlite_tick_store

#ifndef CIVIC_SIM_PERSISTENCE_SQLITE_TICK_STORE_HPP
#define CIVIC_SIM_PERSISTENCE_SQLITE_TICK_STORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "civic-sim/src/Persistence/TickStore.hpp"

namespace civic_sim
{

/**
 * @brief TickStore backed by a SQLite database through cpp_sqlite
 *
 * Every write appends transfer records (see civic-transfer); nothing is
 * updated in place:
 * - TickStartRecord when a tick starts, TickCompletionRecord plus one
 *   ProcessorRunRecord / TickErrorRecord per processor result when it ends
 * - PlayerTickProgressRecord per (player, system) advance; loading folds the
 *   journal keeping the greatest total_months, which is the ordering guard
 * - OfflineSnapshotRecord per capture, OfflineSnapshotConsumedRecord when a
 *   snapshot is consumed or superseded
 *
 * Thread-safe: all database access is serialized by an internal mutex.
 *
 * @ticket 0005_sqlite_tick_store
 */
class SqliteTickStore final : public TickStore
{
public:
  /**
   * @brief Open (or create) the database and load id caches
   *
   * Creates every DAO up front, parent tables first, for FK integrity.
   *
   * @param databasePath Path to SQLite database file
   * @throws std::runtime_error if the database cannot be opened
   */
  explicit SqliteTickStore(const std::string& databasePath);

  SqliteTickStore(const SqliteTickStore&) = delete;
  SqliteTickStore& operator=(const SqliteTickStore&) = delete;
  SqliteTickStore(SqliteTickStore&&) = delete;
  SqliteTickStore& operator=(SqliteTickStore&&) = delete;
  ~SqliteTickStore() override = default;

  std::vector<TickRecord> loadTickRecords() override;
  void saveTickStart(const TickRecord& record) override;
  void saveTickCompletion(const TickRecord& record) override;

  std::vector<PlayerTickState> loadPlayerTickStates() override;
  void upsertPlayerTickState(const PlayerTickState& state,
                             const std::string& system) override;

  std::vector<OfflineSnapshot> loadOfflineSnapshots() override;
  void saveOfflineSnapshot(const OfflineSnapshot& snapshot) override;
  void discardOfflineSnapshot(const std::string& playerId) override;

  /**
   * @brief Access database for queries (const only)
   *
   * Provides read-only access for verification/testing.
   */
  const cpp_sqlite::Database& getDatabase() const;

private:
  void loadIdCaches();
  void markSnapshotConsumed(uint32_t snapshotRecordId);

  std::unique_ptr<cpp_sqlite::Database> database_;
  std::mutex mutex_;

  // tickId -> TickStartRecord id
  std::unordered_map<std::string, uint32_t> tickStartIds_;
  // TickStartRecord ids that already have a completion
  std::set<uint32_t> completedStartIds_;
  // playerId -> live OfflineSnapshotRecord id
  std::unordered_map<std::string, uint32_t> liveSnapshotIds_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_PERSISTENCE_SQLITE_TICK_STORE_HPP
