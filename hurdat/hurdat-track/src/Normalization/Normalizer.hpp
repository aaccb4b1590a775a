// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_NORMALIZER_HPP
#define HURDAT_TRACK_NORMALIZER_HPP

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "hurdat-track/src/Extraction/RawRecords.hpp"
#include "hurdat-track/src/Normalization/TrackTypes.hpp"

namespace hurdat_track
{

/**
 * @brief Converts extracted raw records into typed storms and observations
 *
 * Per observation:
 * - date and time fields become a UTC instant
 * - identifier and status codes are decoded through the fixed code tables
 * - wind -99 and pressure/radii -999 become empty optionals
 *
 * Per storm, using its observations in source order:
 * - start time is the first observation's time
 * - one observation gives a TrackPoint, more give a TrackPath
 *
 * The whole track is rejected on the first decoding failure. The rethrown
 * error names the storm event id and the observation's source line.
 */
class Normalizer
{
public:
  static constexpr int kMissingWind = -99;
  static constexpr int kMissingPressure = -999;
  static constexpr int kMissingRadius = -999;

  explicit Normalizer(std::shared_ptr<spdlog::logger> logger);

  /**
   * @throws TimestampError on an invalid date or time
   * @throws UnknownCodeError on an identifier or status outside the tables
   * @throws MalformedRecordError if the track breaks extraction invariants
   */
  NormalizedTrack normalize(const ExtractedTrack& extracted) const;

  /// Decode a single observation, without source context in diagnostics.
  static Observation normalizeObservation(const RawObservation& raw);

  /// Empty optional when value equals the sentinel, otherwise value.
  static std::optional<int> missingIf(int value, int sentinel)
  {
    return value == sentinel ? std::nullopt : std::optional<int>{value};
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_NORMALIZER_HPP
