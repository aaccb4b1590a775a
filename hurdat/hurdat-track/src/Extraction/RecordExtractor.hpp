// Ticket: 0001_hurdat2_record_extraction

#ifndef HURDAT_TRACK_RECORD_EXTRACTOR_HPP
#define HURDAT_TRACK_RECORD_EXTRACTOR_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "hurdat-track/src/Extraction/RawRecords.hpp"

namespace hurdat_track
{

/**
 * @brief Splits a HURDAT2 text source into header and observation records
 *
 * A line with exactly four comma separated fields is a storm header. Any
 * other non-blank line is an observation of the most recently read header.
 *
 * Header line:
 *   AL092021,                IDA,     40,
 *   event id (basin, number, year), name, number of observation rows
 *
 * Observation line (20 leading fields):
 *   20210829, 1655, L, HU, 29.1N,  90.2W, 130,  931,  130, 110,  80, 110, ...
 *   date, time, identifier, status, latitude, longitude, max wind [kt],
 *   min pressure [mb], then 34/50/64 kt wind radii for NE, SE, SW, NW [nm]
 *
 * Extraction is all-or-nothing: the first malformed line throws and nothing
 * from the source is returned.
 *
 * @note Stateless between calls; one instance may serve several threads.
 */
class RecordExtractor
{
public:
  static constexpr std::size_t kHeaderFieldCount = 4;
  static constexpr std::size_t kObservationFieldCount = 20;
  static constexpr std::size_t kEventIdLength = 8;

  /**
   * @param logger Receives per-storm debug output and per-source totals
   */
  explicit RecordExtractor(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Extract every record from a stream
   *
   * @param input Line-oriented HURDAT2 text
   * @param sourceName Name used in diagnostics (usually the file path)
   * @return Headers and observations in source order
   * @throws MalformedRecordError on the first malformed line
   */
  ExtractedTrack extract(std::istream& input,
                         const std::string& sourceName) const;

  /**
   * @brief Extract every record from a file
   * @throws std::runtime_error if the file cannot be opened
   * @throws MalformedRecordError on the first malformed line
   */
  ExtractedTrack extractFile(const std::filesystem::path& path) const;

private:
  static RawStormHeader parseHeader(const std::vector<std::string_view>& fields,
                                    const std::string& source,
                                    std::size_t lineNumber);

  static RawObservation parseObservation(
    const std::vector<std::string_view>& fields,
    const std::string& source,
    std::size_t lineNumber);

  /// Validate and log a storm once all of its observations have been read.
  void closeStorm(const RawStormHeader& header,
                  std::size_t observationCount,
                  const std::string& source) const;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_RECORD_EXTRACTOR_HPP
