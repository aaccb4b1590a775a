// Ticket: 0002_track_normalization

#include "hurdat-track/src/Normalization/Normalizer.hpp"

#include <format>
#include <utility>
#include <vector>

#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

namespace
{

std::string context(const ExtractedTrack& extracted, const RawObservation& raw)
{
  return std::format(
    "{}:{}: storm {}", extracted.source, raw.lineNumber, raw.eventId);
}

}  // namespace

Normalizer::Normalizer(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
}

Observation Normalizer::normalizeObservation(const RawObservation& raw)
{
  Observation observation;
  observation.eventId = raw.eventId;
  observation.pointTime =
    makeUtcTime(raw.year, raw.month, raw.day, raw.hour, raw.minute);
  observation.identifier = decodeIdentifier(raw.identifierCode);
  observation.status = decodeStatus(raw.statusCode);
  observation.location = GeoCoordinate{raw.longitude, raw.latitude};
  observation.maxWindKnots = missingIf(raw.maxWindKnots, kMissingWind);
  observation.minPressureMb = missingIf(raw.minPressureMb, kMissingPressure);
  for (std::size_t i = 0; i < kWindRadiiCount; ++i)
  {
    observation.windRadiiNm[i] = missingIf(raw.windRadiiNm[i], kMissingRadius);
  }
  return observation;
}

NormalizedTrack Normalizer::normalize(const ExtractedTrack& extracted) const
{
  NormalizedTrack track;
  track.observations.reserve(extracted.observations.size());
  track.storms.reserve(extracted.headers.size());

  // Decode observations and group their path vertices by owning header
  std::vector<std::vector<TrackVertex>> vertices(extracted.headers.size());
  std::vector<std::size_t> firstObservation(extracted.headers.size());
  for (const auto& raw : extracted.observations)
  {
    if (raw.headerIndex >= extracted.headers.size() ||
        extracted.headers[raw.headerIndex].eventId != raw.eventId)
    {
      throw MalformedRecordError{
        extracted.source,
        raw.lineNumber,
        std::format("Observation is not linked to storm {}", raw.eventId)};
    }

    try
    {
      track.observations.push_back(normalizeObservation(raw));
    }
    catch (const TimestampError& e)
    {
      logger_->error("{}: {}", context(extracted, raw), e.what());
      throw TimestampError{
        std::format("{}: {}", context(extracted, raw), e.what())};
    }
    catch (const UnknownCodeError& e)
    {
      logger_->error("{}: {}", context(extracted, raw), e.what());
      throw UnknownCodeError{
        e.code(), std::format("{}: {}", context(extracted, raw), e.what())};
    }

    const Observation& observation = track.observations.back();
    if (vertices[raw.headerIndex].empty())
    {
      firstObservation[raw.headerIndex] = track.observations.size() - 1;
    }
    vertices[raw.headerIndex].push_back(TrackVertex{
      observation.location, observation.maxWindKnots, observation.minPressureMb});
  }

  // Storms take their start time from the first observation in source order
  for (std::size_t i = 0; i < extracted.headers.size(); ++i)
  {
    const RawStormHeader& header = extracted.headers[i];
    if (vertices[i].empty())
    {
      throw MalformedRecordError{
        extracted.source,
        header.lineNumber,
        std::format("Storm {} has no observations", header.eventId)};
    }

    Storm storm;
    storm.eventId = header.eventId;
    storm.basin = header.basin;
    storm.name = header.name;
    storm.startTime = track.observations[firstObservation[i]].pointTime;
    storm.path = makeTrackGeometry(std::move(vertices[i]));
    track.storms.push_back(std::move(storm));
  }

  logger_->info("Normalized {} storms and {} observations from {}",
                track.storms.size(),
                track.observations.size(),
                extracted.source);
  return track;
}

}  // namespace hurdat_track
