#ifndef CIVIC_TRANSFER_PROCESSOR_RUN_RECORD_HPP
#define CIVIC_TRANSFER_PROCESSOR_RUN_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <string>

#include "civic-transfer/src/TickStartRecord.hpp"

namespace civic_transfer
{

/**
 * @brief Outcome of one processor during one tick
 *
 * One row per processor run, in execution order (run_order).
 */
struct ProcessorRunRecord : public cpp_sqlite::BaseTransferObject
{
  std::string processor;
  uint32_t run_order{0};
  uint32_t success{0};  // Boolean as uint32_t for SQLite
  uint32_t items_processed{0};
  double duration_ms{0.0};
  cpp_sqlite::ForeignKey<TickStartRecord> tick;
};

BOOST_DESCRIBE_STRUCT(ProcessorRunRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (processor,
                       run_order,
                       success,
                       items_processed,
                       duration_ms,
                       tick));

/**
 * @brief Single error raised by a processor during a tick
 */
struct TickErrorRecord : public cpp_sqlite::BaseTransferObject
{
  std::string processor;
  std::string entity_id;
  std::string entity_type;
  std::string message;
  uint32_t recoverable{0};  // Boolean as uint32_t for SQLite
  cpp_sqlite::ForeignKey<TickStartRecord> tick;
};

BOOST_DESCRIBE_STRUCT(TickErrorRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (processor,
                       entity_id,
                       entity_type,
                       message,
                       recoverable,
                       tick));

/**
 * @brief One entry of a processor's summary counters
 *
 * Processors report free-form numeric counters (loans issued, votes cast);
 * each key becomes one row under its ProcessorRunRecord.
 */
struct ProcessorSummaryRecord : public cpp_sqlite::BaseTransferObject
{
  std::string key;
  double value{0.0};
  cpp_sqlite::ForeignKey<ProcessorRunRecord> run;
};

BOOST_DESCRIBE_STRUCT(ProcessorSummaryRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (key, value, run));

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_PROCESSOR_RUN_RECORD_HPP
