// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRANSFER_OBSERVATION_RECORD_HPP
#define HURDAT_TRANSFER_OBSERVATION_RECORD_HPP

#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "hurdat-transfer/src/StormRecord.hpp"

namespace hurdat_transfer
{

/**
 * @brief Database record for one best-track observation
 *
 * Nullable numeric columns are stored as doubles defaulting to NaN, which
 * SQLite binds as NULL. A value is NaN exactly when the source carried the
 * missing sentinel (-99 wind, -999 pressure/radii) or a blank/invalid code.
 *
 * Wind radii are the maximum extent in nautical miles of the 34, 50 and 64 kt
 * wind fields in each quadrant.
 *
 * @see hurdat_track::Observation
 * @ticket 0003_track_transfer_records
 */
struct ObservationRecord : public cpp_sqlite::BaseTransferObject
{
  std::string event_id;
  std::string point_time;  // ISO-8601 UTC
  double identifier{std::numeric_limits<double>::quiet_NaN()};  // IdentifierCodeRecord::code_id
  double status{std::numeric_limits<double>::quiet_NaN()};      // StatusCodeRecord::code_id
  std::string location;    // WKT "POINT(lon lat)"
  double max_wind_knots{std::numeric_limits<double>::quiet_NaN()};
  double min_pressure_mb{std::numeric_limits<double>::quiet_NaN()};

  double ne_34kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double se_34kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double sw_34kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double nw_34kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double ne_50kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double se_50kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double sw_50kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double nw_50kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double ne_64kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double se_64kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double sw_64kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};
  double nw_64kt_radii_max_nm{std::numeric_limits<double>::quiet_NaN()};

  cpp_sqlite::ForeignKey<StormRecord> storm;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ObservationRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (event_id,
                       point_time,
                       identifier,
                       status,
                       location,
                       max_wind_knots,
                       min_pressure_mb,
                       ne_34kt_radii_max_nm,
                       se_34kt_radii_max_nm,
                       sw_34kt_radii_max_nm,
                       nw_34kt_radii_max_nm,
                       ne_50kt_radii_max_nm,
                       se_50kt_radii_max_nm,
                       sw_50kt_radii_max_nm,
                       nw_50kt_radii_max_nm,
                       ne_64kt_radii_max_nm,
                       se_64kt_radii_max_nm,
                       sw_64kt_radii_max_nm,
                       nw_64kt_radii_max_nm,
                       storm));

}  // namespace hurdat_transfer

#endif  // HURDAT_TRANSFER_OBSERVATION_RECORD_HPP
