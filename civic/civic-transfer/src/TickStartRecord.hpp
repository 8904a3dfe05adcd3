// Ticket: 0005_sqlite_tick_store

#ifndef CIVIC_TRANSFER_TICK_START_RECORD_HPP
#define CIVIC_TRANSFER_TICK_START_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <string>

namespace civic_transfer
{

/**
 * @brief Database record written when a tick enters the Running state
 *
 * Tick records are append-only. A tick is Running until a
 * TickCompletionRecord referencing this record exists.
 *
 * @ticket 0005_sqlite_tick_store
 */
struct TickStartRecord : public cpp_sqlite::BaseTransferObject
{
  std::string tick_id;                // Unique tick identifier
  uint32_t year{0};
  uint32_t month{0};
  uint32_t total_months{0};           // Canonical tick index
  uint32_t triggered_by{0};           // civic_sim::TickTrigger as integer
  std::string triggered_by_user_id;   // Empty when not user-triggered
  double started_at{0.0};             // Wall clock [seconds since epoch]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(TickStartRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (tick_id,
                       year,
                       month,
                       total_months,
                       triggered_by,
                       triggered_by_user_id,
                       started_at));

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_TICK_START_RECORD_HPP
