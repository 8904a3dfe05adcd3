// Ticket: 0005_sqlite_tick_store

#ifndef CIVIC_TRANSFER_TICK_COMPLETION_RECORD_HPP
#define CIVIC_TRANSFER_TICK_COMPLETION_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <string>

#include "civic-transfer/src/TickStartRecord.hpp"

namespace civic_transfer
{

/**
 * @brief Database record closing a tick
 *
 * Written exactly once per tick. Per-processor outcomes reference the same
 * TickStartRecord through ProcessorRunRecord.
 *
 * @note Boolean fields use uint32_t for SQLite compatibility.
 *
 * @ticket 0005_sqlite_tick_store
 */
struct TickCompletionRecord : public cpp_sqlite::BaseTransferObject
{
  double completed_at{0.0};             // Wall clock [seconds since epoch]
  double duration_ms{0.0};
  uint32_t success{0};                  // 1 = every processor succeeded
  uint32_t total_items_processed{0};
  uint32_t total_errors{0};
  uint32_t timed_out{0};                // 1 = closed by timeout recovery
  uint32_t forced_by_operator{0};       // 1 = closed by forceCompleteTick
  std::string failure_reason;           // Empty unless cut short
  cpp_sqlite::ForeignKey<TickStartRecord> tick;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(TickCompletionRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (completed_at,
                       duration_ms,
                       success,
                       total_items_processed,
                       total_errors,
                       timed_out,
                       forced_by_operator,
                       failure_reason,
                       tick));

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_TICK_COMPLETION_RECORD_HPP
