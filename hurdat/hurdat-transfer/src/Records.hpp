// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRANSFER_RECORDS_HPP
#define HURDAT_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 *
 * Single include point for the storm, observation and code table records
 * handed to the storage layer.
 *
 * @ticket 0003_track_transfer_records
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "hurdat-transfer/src/IdentifierCodeRecord.hpp"
#include "hurdat-transfer/src/ObservationRecord.hpp"
#include "hurdat-transfer/src/StatusCodeRecord.hpp"
#include "hurdat-transfer/src/StormRecord.hpp"

namespace hurdat_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 */
using Database = cpp_sqlite::Database;

}  // namespace hurdat_transfer

#endif  // HURDAT_TRANSFER_RECORDS_HPP
