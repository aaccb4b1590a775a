// Ticket: 0001_hurdat2_record_extraction

#include "hurdat-track/src/Extraction/RecordExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_set>

#include "hurdat-track/src/Extraction/FieldParsing.hpp"
#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

namespace
{

// Observation field positions
constexpr std::size_t kDateField = 0;
constexpr std::size_t kTimeField = 1;
constexpr std::size_t kIdentifierField = 2;
constexpr std::size_t kStatusField = 3;
constexpr std::size_t kLatitudeField = 4;
constexpr std::size_t kLongitudeField = 5;
constexpr std::size_t kMaxWindField = 6;
constexpr std::size_t kMinPressureField = 7;
constexpr std::size_t kFirstRadiiField = 8;

bool isDigits(std::string_view text)
{
  return !text.empty() &&
         std::ranges::all_of(
           text, [](unsigned char c) { return std::isdigit(c) != 0; });
}

int requireInteger(std::string_view field,
                   std::string_view what,
                   const std::string& source,
                   std::size_t lineNumber)
{
  const std::optional<int> value = detail::parseInteger(field);
  if (!value)
  {
    throw MalformedRecordError{
      source, lineNumber, std::format("{} '{}' is not an integer", what, field)};
  }
  return *value;
}

/**
 * Parse "28.0N" style text. The last character is the hemisphere, the rest
 * is the unsigned magnitude (digits and at most one '.', no sign, no nan or
 * inf). The negative hemisphere negates the value.
 */
double requireSignedDegrees(std::string_view field,
                            char positive,
                            char negative,
                            std::string_view what,
                            const std::string& source,
                            std::size_t lineNumber)
{
  const std::string_view text = detail::trim(field);
  if (text.size() < 2)
  {
    throw MalformedRecordError{
      source, lineNumber, std::format("{} '{}' is too short", what, field)};
  }

  const char hemisphere = text.back();
  if (hemisphere != positive && hemisphere != negative)
  {
    throw MalformedRecordError{
      source,
      lineNumber,
      std::format("{} '{}' must end in '{}' or '{}'",
                  what,
                  field,
                  positive,
                  negative)};
  }

  const std::string_view digits = text.substr(0, text.size() - 1);
  const bool unsignedDecimal =
    std::ranges::any_of(
      digits, [](unsigned char c) { return std::isdigit(c) != 0; }) &&
    std::ranges::all_of(
      digits,
      [](unsigned char c) { return std::isdigit(c) != 0 || c == '.'; }) &&
    std::ranges::count(digits, '.') <= 1;

  const std::optional<double> magnitude =
    unsignedDecimal ? detail::parseDecimal(digits) : std::optional<double>{};
  if (!magnitude || !std::isfinite(*magnitude))
  {
    throw MalformedRecordError{
      source, lineNumber, std::format("{} '{}' is not a number", what, field)};
  }
  return hemisphere == negative ? -*magnitude : *magnitude;
}

}  // namespace

RecordExtractor::RecordExtractor(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
}

ExtractedTrack RecordExtractor::extract(std::istream& input,
                                        const std::string& sourceName) const
{
  ExtractedTrack track;
  track.source = sourceName;

  std::unordered_set<std::string> seenEventIds;

  // The storm that owns incoming observation lines, and how many it has
  std::optional<std::size_t> currentHeader;
  std::size_t currentCount = 0;

  std::string line;
  std::size_t lineNumber = 0;
  while (std::getline(input, line))
  {
    ++lineNumber;

    const std::string_view content = detail::trimRight(line);
    if (content.empty())
    {
      continue;
    }

    const auto fields = detail::splitFields(content);
    if (fields.size() == kHeaderFieldCount)
    {
      if (currentHeader)
      {
        closeStorm(track.headers[*currentHeader], currentCount, sourceName);
      }

      RawStormHeader header = parseHeader(fields, sourceName, lineNumber);
      if (!seenEventIds.insert(header.eventId).second)
      {
        throw MalformedRecordError{
          sourceName,
          lineNumber,
          std::format("Duplicate event id '{}'", header.eventId)};
      }

      currentHeader = track.headers.size();
      currentCount = 0;
      track.headers.push_back(std::move(header));
      continue;
    }

    if (!currentHeader)
    {
      throw MalformedRecordError{
        sourceName, lineNumber, "Observation line before any storm header"};
    }

    RawObservation observation =
      parseObservation(fields, sourceName, lineNumber);
    observation.eventId = track.headers[*currentHeader].eventId;
    observation.headerIndex = *currentHeader;
    track.observations.push_back(std::move(observation));
    ++currentCount;
  }

  if (currentHeader)
  {
    closeStorm(track.headers[*currentHeader], currentCount, sourceName);
  }

  logger_->info("Extracted {} storms and {} observations from {}",
                track.headers.size(),
                track.observations.size(),
                sourceName);
  return track;
}

ExtractedTrack RecordExtractor::extractFile(
  const std::filesystem::path& path) const
{
  std::ifstream file{path};
  if (!file.is_open())
  {
    logger_->error("Cannot open HURDAT2 file: {}", path.string());
    throw std::runtime_error{"Cannot open HURDAT2 file: " + path.string()};
  }

  logger_->debug("Reading HURDAT2 file: {}", path.string());
  return extract(file, path.string());
}

RawStormHeader RecordExtractor::parseHeader(
  const std::vector<std::string_view>& fields,
  const std::string& source,
  std::size_t lineNumber)
{
  const std::string_view eventId = fields[0];
  if (eventId.size() != kEventIdLength)
  {
    throw MalformedRecordError{
      source,
      lineNumber,
      std::format("Event id '{}' must be {} characters",
                  eventId,
                  kEventIdLength)};
  }

  RawStormHeader header;
  header.eventId = std::string{eventId};
  header.basin = std::string{eventId.substr(0, 2)};
  header.stormNumber = std::string{eventId.substr(2, 2)};
  header.year = std::string{eventId.substr(4, 4)};
  header.name = std::string{detail::stripLeadingSpaces(fields[1])};
  header.declaredPointCount =
    requireInteger(fields[2], "Observation count", source, lineNumber);
  header.lineNumber = lineNumber;

  if (!isDigits(header.stormNumber) || !isDigits(header.year))
  {
    throw MalformedRecordError{
      source,
      lineNumber,
      std::format("Event id '{}' must end in a storm number and year",
                  eventId)};
  }
  if (header.declaredPointCount < 1)
  {
    throw MalformedRecordError{
      source,
      lineNumber,
      std::format("Storm {} declares {} observations",
                  header.eventId,
                  header.declaredPointCount)};
  }

  return header;
}

RawObservation RecordExtractor::parseObservation(
  const std::vector<std::string_view>& fields,
  const std::string& source,
  std::size_t lineNumber)
{
  if (fields.size() < kObservationFieldCount)
  {
    throw MalformedRecordError{
      source,
      lineNumber,
      std::format("Observation has {} fields, expected at least {}",
                  fields.size(),
                  kObservationFieldCount)};
  }

  RawObservation observation;
  observation.lineNumber = lineNumber;

  // YYYYMMDD
  const std::string_view date = fields[kDateField];
  observation.year = std::string{detail::slice(date, 0, 4)};
  observation.month = std::string{detail::slice(date, 4, 2)};
  observation.day = std::string{detail::slice(date, 6, 2)};

  // hhmm, right aligned
  const std::string_view time = fields[kTimeField];
  observation.hour =
    std::string{detail::slice(detail::stripLeadingSpaces(time), 0, 2)};
  observation.minute = std::string{detail::lastChars(detail::trimRight(time), 2)};

  const std::string_view identifier = fields[kIdentifierField];
  if (identifier.empty())
  {
    throw MalformedRecordError{source, lineNumber, "Empty record identifier"};
  }
  observation.identifierCode = std::string{detail::lastChars(identifier, 1)};

  const std::string_view status = fields[kStatusField];
  if (status.size() < 2)
  {
    throw MalformedRecordError{
      source, lineNumber, std::format("Status '{}' is too short", status)};
  }
  observation.statusCode = std::string{detail::lastChars(status, 2)};

  observation.latitude = requireSignedDegrees(
    fields[kLatitudeField], 'N', 'S', "Latitude", source, lineNumber);
  observation.longitude = requireSignedDegrees(
    fields[kLongitudeField], 'E', 'W', "Longitude", source, lineNumber);

  observation.maxWindKnots = requireInteger(
    fields[kMaxWindField], "Maximum wind", source, lineNumber);
  observation.minPressureMb = requireInteger(
    fields[kMinPressureField], "Minimum pressure", source, lineNumber);
  for (std::size_t i = 0; i < kWindRadiiCount; ++i)
  {
    observation.windRadiiNm[i] = requireInteger(
      fields[kFirstRadiiField + i], "Wind radius", source, lineNumber);
  }

  return observation;
}

void RecordExtractor::closeStorm(const RawStormHeader& header,
                                 std::size_t observationCount,
                                 const std::string& source) const
{
  if (observationCount == 0)
  {
    throw MalformedRecordError{
      source,
      header.lineNumber,
      std::format("Storm {} has no observations", header.eventId)};
  }

  if (observationCount != static_cast<std::size_t>(header.declaredPointCount))
  {
    logger_->warn("{}:{}: storm {} declares {} observations but has {}",
                  source,
                  header.lineNumber,
                  header.eventId,
                  header.declaredPointCount,
                  observationCount);
  }

  logger_->debug("Extracted storm {} ({}) with {} observations",
                 header.eventId,
                 header.name,
                 observationCount);
}

}  // namespace hurdat_track
