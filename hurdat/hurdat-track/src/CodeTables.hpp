// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_CODE_TABLES_HPP
#define HURDAT_TRACK_CODE_TABLES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "hurdat-transfer/src/IdentifierCodeRecord.hpp"
#include "hurdat-transfer/src/StatusCodeRecord.hpp"

namespace hurdat_track
{

/**
 * @brief Reason a best-track observation was included
 *
 * Underlying values are the code ids written to the lookup table.
 */
enum class RecordIdentifier : uint8_t
{
  ClosestApproach = 0,  // C
  Genesis = 1,          // G
  IntensityPeak = 2,    // I
  Landfall = 3,         // L
  MinimumPressure = 4,  // P
  RapidChange = 5,      // R
  StatusChange = 6,     // S
  TrackDetail = 7,      // T
  MaximumWind = 8,      // W
};

/**
 * @brief Storm classification at the time of an observation
 */
enum class StormStatus : uint8_t
{
  TropicalDepression = 0,     // TD
  TropicalStorm = 1,          // TS
  Hurricane = 2,              // HU
  Extratropical = 3,          // EX
  SubtropicalDepression = 4,  // SD
  SubtropicalStorm = 5,       // SS
  Low = 6,                    // LO
  TropicalWave = 7,           // WV
  Disturbance = 8,            // DB
};

template <typename Enum>
struct CodeEntry
{
  std::string_view code;
  Enum value;
  std::string_view description;
};

inline constexpr std::array<CodeEntry<RecordIdentifier>, 9> kIdentifierTable{{
  {"C",
   RecordIdentifier::ClosestApproach,
   "closest approach to a coast, not followed by a landfall"},
  {"G", RecordIdentifier::Genesis, "genesis"},
  {"I",
   RecordIdentifier::IntensityPeak,
   "an intensity peak in terms of both pressure and wind"},
  {"L", RecordIdentifier::Landfall, "landfall"},
  {"P", RecordIdentifier::MinimumPressure, "minimum central pressure"},
  {"R",
   RecordIdentifier::RapidChange,
   "additional detail on intensity of cyclone when rapid changes are "
   "underway"},
  {"S", RecordIdentifier::StatusChange, "change in status of the system"},
  {"T",
   RecordIdentifier::TrackDetail,
   "provides additional detail on the track (position) of the cyclone"},
  {"W", RecordIdentifier::MaximumWind, "maximum sustained wind speed"},
}};

/// Identifier codes that mean "not recorded".
inline constexpr std::array<std::string_view, 1> kIdentifierMissingCodes{" "};

inline constexpr std::array<CodeEntry<StormStatus>, 9> kStatusTable{{
  {"TD",
   StormStatus::TropicalDepression,
   "tropical cyclone of tropical depression intensity (<34 knots)"},
  {"TS",
   StormStatus::TropicalStorm,
   "tropical cyclone of tropical storm intensity (34-63 knots)"},
  {"HU",
   StormStatus::Hurricane,
   "tropical cyclone of hurricane intensity (>= 64 knots)"},
  {"EX", StormStatus::Extratropical, "extratropical cyclone of any intensity"},
  {"SD",
   StormStatus::SubtropicalDepression,
   "subtropical cyclone of subtropical depression intensity (<34 knots)"},
  {"SS",
   StormStatus::SubtropicalStorm,
   "subtropical cyclone of subtropical storm intensity (>= 34 knots)"},
  {"LO",
   StormStatus::Low,
   "low that is neither a tropical cyclone, a subtropical cyclone, nor an "
   "extratropical cyclone"},
  {"WV", StormStatus::TropicalWave, "a tropical wave"},
  {"DB", StormStatus::Disturbance, "disturbance of any intensity"},
}};

/**
 * Status codes that mean "not recorded". Besides the blank code these are the
 * Northeast Pacific codes ET, TY, ST and PT, which have no documented meaning
 * and are never mapped to a guessed classification.
 */
inline constexpr std::array<std::string_view, 5> kStatusMissingCodes{
  "  ", "ET", "TY", "ST", "PT"};

/**
 * @brief Decode a one-character identifier code
 * @return std::nullopt for the missing sentinel
 * @throws UnknownCodeError for any other code outside the table
 */
std::optional<RecordIdentifier> decodeIdentifier(std::string_view code);

/**
 * @brief Decode a two-character status code
 * @return std::nullopt for a missing sentinel
 * @throws UnknownCodeError for any other code outside the table
 */
std::optional<StormStatus> decodeStatus(std::string_view code);

/**
 * @brief Source code for an enumerator, e.g. Landfall -> "L"
 * @throws std::invalid_argument for a value with no table row
 */
std::string_view identifierCode(RecordIdentifier identifier);
std::string_view statusCode(StormStatus status);

/// Lookup table rows in code id order.
std::vector<hurdat_transfer::IdentifierCodeRecord> identifierCodeRecords();
std::vector<hurdat_transfer::StatusCodeRecord> statusCodeRecords();

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_CODE_TABLES_HPP
