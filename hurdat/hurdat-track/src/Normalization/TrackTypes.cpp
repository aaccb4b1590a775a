// Ticket: 0003_track_transfer_records

#include "hurdat-track/src/Normalization/TrackTypes.hpp"

#include <limits>

namespace hurdat_track
{

namespace
{

double nullable(const std::optional<int>& value)
{
  return value ? static_cast<double>(*value)
               : std::numeric_limits<double>::quiet_NaN();
}

template <typename Enum>
double nullableCode(const std::optional<Enum>& value)
{
  return value ? static_cast<double>(static_cast<uint32_t>(*value))
               : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace

hurdat_transfer::ObservationRecord Observation::toRecord() const
{
  using enum WindThreshold;
  using enum Quadrant;

  hurdat_transfer::ObservationRecord record;
  record.event_id = eventId;
  record.point_time = formatUtcTime(pointTime);
  record.identifier = nullableCode(identifier);
  record.status = nullableCode(status);
  record.location = location.toWkt();
  record.max_wind_knots = nullable(maxWindKnots);
  record.min_pressure_mb = nullable(minPressureMb);

  record.ne_34kt_radii_max_nm = nullable(windRadius(Knots34, NorthEast));
  record.se_34kt_radii_max_nm = nullable(windRadius(Knots34, SouthEast));
  record.sw_34kt_radii_max_nm = nullable(windRadius(Knots34, SouthWest));
  record.nw_34kt_radii_max_nm = nullable(windRadius(Knots34, NorthWest));
  record.ne_50kt_radii_max_nm = nullable(windRadius(Knots50, NorthEast));
  record.se_50kt_radii_max_nm = nullable(windRadius(Knots50, SouthEast));
  record.sw_50kt_radii_max_nm = nullable(windRadius(Knots50, SouthWest));
  record.nw_50kt_radii_max_nm = nullable(windRadius(Knots50, NorthWest));
  record.ne_64kt_radii_max_nm = nullable(windRadius(Knots64, NorthEast));
  record.se_64kt_radii_max_nm = nullable(windRadius(Knots64, SouthEast));
  record.sw_64kt_radii_max_nm = nullable(windRadius(Knots64, SouthWest));
  record.nw_64kt_radii_max_nm = nullable(windRadius(Knots64, NorthWest));
  return record;
}

hurdat_transfer::StormRecord Storm::toRecord() const
{
  hurdat_transfer::StormRecord record;
  record.event_id = eventId;
  record.basin = basin;
  record.name = name;
  record.start_time = formatUtcTime(startTime);
  record.path = toWkt(path);
  return record;
}

}  // namespace hurdat_track
