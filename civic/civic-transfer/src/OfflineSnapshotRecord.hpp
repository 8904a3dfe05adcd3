// Ticket: 0004_offline_protection

#ifndef CIVIC_TRANSFER_OFFLINE_SNAPSHOT_RECORD_HPP
#define CIVIC_TRANSFER_OFFLINE_SNAPSHOT_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <limits>
#include <string>

namespace civic_transfer
{

/**
 * @brief Player state captured when a session ends
 *
 * A snapshot is live until an OfflineSnapshotConsumedRecord references it.
 *
 * @ticket 0004_offline_protection
 */
struct OfflineSnapshotRecord : public cpp_sqlite::BaseTransferObject
{
  std::string player_id;
  uint32_t captured_at_week{0};
  double influence{0.0};
  double approval_rating{std::numeric_limits<double>::quiet_NaN()};
  uint32_t has_approval_rating{0};  // Boolean as uint32_t for SQLite
  uint32_t autopilot_strategy{0};   // civic_sim::AutopilotStrategy as integer
};

BOOST_DESCRIBE_STRUCT(OfflineSnapshotRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (player_id,
                       captured_at_week,
                       influence,
                       approval_rating,
                       has_approval_rating,
                       autopilot_strategy));

/**
 * @brief Marks an OfflineSnapshotRecord as consumed (or superseded)
 */
struct OfflineSnapshotConsumedRecord : public cpp_sqlite::BaseTransferObject
{
  double consumed_at{0.0};  // Wall clock [seconds since epoch]
  cpp_sqlite::ForeignKey<OfflineSnapshotRecord> snapshot;
};

BOOST_DESCRIBE_STRUCT(OfflineSnapshotConsumedRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (consumed_at, snapshot));

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_OFFLINE_SNAPSHOT_RECORD_HPP
