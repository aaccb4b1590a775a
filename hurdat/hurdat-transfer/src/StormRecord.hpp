// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRANSFER_STORM_RECORD_HPP
#define HURDAT_TRANSFER_STORM_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hurdat_transfer
{

/**
 * @brief Database record for one storm (one HURDAT2 header entry)
 *
 * The id field inherited from BaseTransferObject is assigned 1..N in output
 * order and is the target of ObservationRecord::storm. event_id remains the
 * natural key of the table.
 *
 * Text columns:
 * - start_time: "YYYY-MM-DDThh:mm:00.000Z" of the first observation
 * - path: WKT, POINT for single-observation storms, LINESTRING otherwise.
 *   Each vertex is "lon lat wind pressure" with NULL for missing values.
 *
 * @see hurdat_track::Storm
 * @ticket 0003_track_transfer_records
 */
struct StormRecord : public cpp_sqlite::BaseTransferObject
{
  std::string event_id;    // <basin:2><number:2><year:4>, e.g. "AL092023"
  std::string basin;       // e.g. "AL", "EP", "CP"
  std::string name;        // e.g. "IDA", "UNNAMED"
  std::string start_time;  // ISO-8601 UTC
  std::string path;        // WKT
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(StormRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (event_id, basin, name, start_time, path));

}  // namespace hurdat_transfer

#endif  // HURDAT_TRANSFER_STORM_RECORD_HPP
