// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_UTC_TIME_HPP
#define HURDAT_TRACK_UTC_TIME_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace hurdat_track
{

/// Synoptic times carry no seconds, so minute resolution is exact.
using UtcTime = std::chrono::sys_time<std::chrono::minutes>;

/**
 * @brief Compose and parse "YYYY-MM-DDThh:mm:00.000Z"
 *
 * Each component must be all digits with the expected width, the calendar
 * date must exist (including leap days), hour in [0, 23] and minute in
 * [0, 59].
 *
 * @throws TimestampError naming the composed text on any violation
 */
UtcTime makeUtcTime(std::string_view year,
                    std::string_view month,
                    std::string_view day,
                    std::string_view hour,
                    std::string_view minute);

/**
 * @brief Parse an ISO-8601 instant of the form "YYYY-MM-DDThh:mm:00.000Z"
 * @throws TimestampError if the text is not of that exact shape
 */
UtcTime parseUtcTime(std::string_view iso);

/// Render as "YYYY-MM-DDThh:mm:00.000Z".
std::string formatUtcTime(UtcTime time);

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_UTC_TIME_HPP
