// Ticket: 0003_track_transfer_records

#include "hurdat-track/src/Transfer/TrackRecords.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <unordered_map>

#include "hurdat-track/src/CodeTables.hpp"
#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

TrackRecords toRecords(const NormalizedTrack& track)
{
  TrackRecords records;
  records.storms.reserve(track.storms.size());
  records.observations.reserve(track.observations.size());

  std::unordered_map<std::string, uint32_t> stormIds;
  for (const auto& storm : track.storms)
  {
    auto record = storm.toRecord();
    record.id = static_cast<uint32_t>(records.storms.size() + 1);
    stormIds.emplace(storm.eventId, record.id);
    records.storms.push_back(std::move(record));
  }

  for (const auto& observation : track.observations)
  {
    auto it = stormIds.find(observation.eventId);
    if (it == stormIds.end())
    {
      throw MalformedRecordError{
        "records",
        0,
        std::format("Observation references unknown storm {}",
                    observation.eventId)};
    }

    auto record = observation.toRecord();
    record.id = static_cast<uint32_t>(records.observations.size() + 1);
    record.storm.id = it->second;
    records.observations.push_back(std::move(record));
  }

  records.identifiers = identifierCodeRecords();
  records.statuses = statusCodeRecords();
  return records;
}

}  // namespace hurdat_track
