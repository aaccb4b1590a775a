// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRACK_TRACK_RECORDS_HPP
#define HURDAT_TRACK_TRACK_RECORDS_HPP

#include <vector>

#include "hurdat-track/src/Normalization/TrackTypes.hpp"
#include "hurdat-transfer/src/Records.hpp"

namespace hurdat_track
{

/**
 * @brief Everything the storage layer bulk-loads for one run
 *
 * storms[i].id == i + 1, and every observation's storm.id points at the
 * storm with the same event_id. The code tables are the same for every run.
 */
struct TrackRecords
{
  std::vector<hurdat_transfer::StormRecord> storms;
  std::vector<hurdat_transfer::ObservationRecord> observations;
  std::vector<hurdat_transfer::IdentifierCodeRecord> identifiers;
  std::vector<hurdat_transfer::StatusCodeRecord> statuses;
};

/**
 * @brief Convert a normalized track into transfer records
 *
 * @throws MalformedRecordError if an observation names a storm that is not
 *         in the track
 */
TrackRecords toRecords(const NormalizedTrack& track);

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_TRACK_RECORDS_HPP
