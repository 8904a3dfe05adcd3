#ifndef CIVIC_TRANSFER_RECORDS_HPP
#define CIVIC_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 *
 * This header provides a single include point for all civic-transfer records.
 * Use this when you need access to the complete tick store schema.
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "civic-transfer/src/OfflineSnapshotRecord.hpp"
#include "civic-transfer/src/PlayerTickProgressRecord.hpp"
#include "civic-transfer/src/ProcessorRunRecord.hpp"
#include "civic-transfer/src/TickCompletionRecord.hpp"
#include "civic-transfer/src/TickStartRecord.hpp"

namespace civic_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 *
 * Convenience alias to avoid repeating namespace qualification.
 */
using Database = cpp_sqlite::Database;

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_RECORDS_HPP
