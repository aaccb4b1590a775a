// Ticket: 0002_track_normalization

#include "hurdat-track/src/DataTypes/UtcTime.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

namespace
{

int parseComponent(std::string_view digits,
                   std::size_t width,
                   std::string_view iso)
{
  const bool allDigits = std::ranges::all_of(
    digits, [](unsigned char c) { return std::isdigit(c) != 0; });

  int value = 0;
  const auto result =
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.size() != width || !allDigits || result.ec != std::errc{})
  {
    throw TimestampError{std::format("Invalid timestamp '{}'", iso)};
  }
  return value;
}

}  // namespace

UtcTime makeUtcTime(std::string_view year,
                    std::string_view month,
                    std::string_view day,
                    std::string_view hour,
                    std::string_view minute)
{
  return parseUtcTime(
    std::format("{}-{}-{}T{}:{}:00.000Z", year, month, day, hour, minute));
}

UtcTime parseUtcTime(std::string_view iso)
{
  // YYYY-MM-DDThh:mm:00.000Z
  constexpr std::string_view kSuffix = ":00.000Z";
  if (iso.size() != 24 || iso[4] != '-' || iso[7] != '-' || iso[10] != 'T' ||
      iso[13] != ':' || iso.substr(16) != kSuffix)
  {
    throw TimestampError{std::format("Invalid timestamp '{}'", iso)};
  }

  const int y = parseComponent(iso.substr(0, 4), 4, iso);
  const int m = parseComponent(iso.substr(5, 2), 2, iso);
  const int d = parseComponent(iso.substr(8, 2), 2, iso);
  const int hh = parseComponent(iso.substr(11, 2), 2, iso);
  const int mm = parseComponent(iso.substr(14, 2), 2, iso);

  const std::chrono::year_month_day date{std::chrono::year{y},
                                         std::chrono::month{
                                           static_cast<unsigned>(m)},
                                         std::chrono::day{
                                           static_cast<unsigned>(d)}};
  if (!date.ok())
  {
    throw TimestampError{
      std::format("Invalid calendar date in timestamp '{}'", iso)};
  }
  if (hh > 23 || mm > 59)
  {
    throw TimestampError{
      std::format("Invalid time of day in timestamp '{}'", iso)};
  }

  return std::chrono::sys_days{date} + std::chrono::hours{hh} +
         std::chrono::minutes{mm};
}

std::string formatUtcTime(UtcTime time)
{
  const auto days = std::chrono::floor<std::chrono::days>(time);
  const std::chrono::year_month_day date{days};
  const std::chrono::hh_mm_ss<std::chrono::minutes> clock{time - days};

  return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:00.000Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()),
                     clock.hours().count(),
                     clock.minutes().count());
}

}  // namespace hurdat_track
