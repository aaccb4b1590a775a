// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_TRACK_TYPES_HPP
#define HURDAT_TRACK_TRACK_TYPES_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "hurdat-track/src/CodeTables.hpp"
#include "hurdat-track/src/DataTypes/GeoCoordinate.hpp"
#include "hurdat-track/src/DataTypes/TrackGeometry.hpp"
#include "hurdat-track/src/DataTypes/UtcTime.hpp"
#include "hurdat-track/src/Extraction/RawRecords.hpp"
#include "hurdat-transfer/src/ObservationRecord.hpp"
#include "hurdat-transfer/src/StormRecord.hpp"

namespace hurdat_track
{

enum class WindThreshold : std::size_t
{
  Knots34 = 0,
  Knots50 = 1,
  Knots64 = 2,
};

enum class Quadrant : std::size_t
{
  NorthEast = 0,
  SouthEast = 1,
  SouthWest = 2,
  NorthWest = 3,
};

/**
 * @brief One decoded best-track observation
 *
 * Every optional is empty exactly when the source carried the corresponding
 * missing sentinel.
 */
struct Observation
{
  std::string eventId;
  UtcTime pointTime;
  std::optional<RecordIdentifier> identifier;
  std::optional<StormStatus> status;
  GeoCoordinate location;
  std::optional<int> maxWindKnots;
  std::optional<int> minPressureMb;
  std::array<std::optional<int>, kWindRadiiCount> windRadiiNm;

  /// Radii are stored threshold-major: 34 kt NE, SE, SW, NW, then 50 kt...
  const std::optional<int>& windRadius(WindThreshold threshold,
                                       Quadrant quadrant) const
  {
    return windRadiiNm[static_cast<std::size_t>(threshold) * 4 +
                       static_cast<std::size_t>(quadrant)];
  }

  /// Storm foreign key is left unset; see toRecords().
  [[nodiscard]] hurdat_transfer::ObservationRecord toRecord() const;
};

/**
 * @brief One storm with its derived start time and path
 */
struct Storm
{
  std::string eventId;
  std::string basin;
  std::string name;
  UtcTime startTime;
  TrackGeometry path;

  [[nodiscard]] hurdat_transfer::StormRecord toRecord() const;
};

/**
 * @brief Storms and observations ready to hand to storage
 *
 * Storms keep header order and observations keep source order, so the
 * observations of one storm are contiguous and chronological.
 */
struct NormalizedTrack
{
  std::vector<Storm> storms;
  std::vector<Observation> observations;
};

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_TRACK_TYPES_HPP
