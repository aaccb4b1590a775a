// Ticket: 0001_hurdat2_record_extraction

#ifndef HURDAT_TRACK_RAW_RECORDS_HPP
#define HURDAT_TRACK_RAW_RECORDS_HPP

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace hurdat_track
{

/// 34/50/64 kt thresholds × NE/SE/SW/NW quadrants.
inline constexpr std::size_t kWindRadiiCount = 12;

/**
 * @brief Header line fields, sliced but not yet validated against the data
 *
 * stormNumber and year only exist here; they are not carried into Storm.
 */
struct RawStormHeader
{
  std::string eventId;
  std::string basin;
  std::string stormNumber;
  std::string year;
  std::string name;
  int declaredPointCount{0};
  std::size_t lineNumber{0};
};

/**
 * @brief Observation line fields before decoding
 *
 * Date and time stay as the sliced text so the normalizer can report the
 * exact composed timestamp on failure. identifierCode and statusCode are the
 * raw 1 and 2 character codes. Latitude and longitude already carry the
 * hemisphere sign. Wind and pressure still hold their -99 / -999 sentinels.
 */
struct RawObservation
{
  std::string eventId;
  std::size_t headerIndex{0};  // Index into ExtractedTrack::headers
  std::size_t lineNumber{0};

  std::string year;
  std::string month;
  std::string day;
  std::string hour;
  std::string minute;

  std::string identifierCode;
  std::string statusCode;

  double latitude{0.0};
  double longitude{0.0};

  int maxWindKnots{0};
  int minPressureMb{0};
  std::array<int, kWindRadiiCount> windRadiiNm{};
};

/**
 * @brief Output of RecordExtractor for one source
 *
 * Both sequences keep source order. Every header owns at least one
 * observation, and the observations of headers[i] are contiguous.
 */
struct ExtractedTrack
{
  std::string source;
  std::vector<RawStormHeader> headers;
  std::vector<RawObservation> observations;
};

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_RAW_RECORDS_HPP
