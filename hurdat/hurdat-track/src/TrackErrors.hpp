// Ticket: 0001_hurdat2_record_extraction
// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_TRACK_ERRORS_HPP
#define HURDAT_TRACK_TRACK_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hurdat_track
{

/**
 * @brief Base for every failure that invalidates a whole source file
 *
 * None of these are retried or downgraded to a skipped row: a dropped
 * observation would silently corrupt the storm path being assembled.
 */
class TrackError : public std::runtime_error
{
public:
  explicit TrackError(const std::string& message) : std::runtime_error{message}
  {
  }
};

/**
 * @brief Wrong field count, unparseable number or broken header linkage
 *
 * lineNumber() is the 1-based source line, or 0 when the failure is not tied
 * to a single line (e.g. an event id repeated across files).
 */
class MalformedRecordError final : public TrackError
{
public:
  MalformedRecordError(const std::string& source,
                       std::size_t lineNumber,
                       const std::string& detail)
    : TrackError{source + ":" + std::to_string(lineNumber) + ": " + detail},
      lineNumber_{lineNumber}
  {
  }

  std::size_t lineNumber() const
  {
    return lineNumber_;
  }

private:
  std::size_t lineNumber_;
};

/**
 * @brief Date/time components that do not form a valid UTC instant
 */
class TimestampError final : public TrackError
{
public:
  explicit TimestampError(const std::string& message) : TrackError{message}
  {
  }
};

/**
 * @brief Identifier or status code outside its table and not a missing
 * sentinel
 */
class UnknownCodeError final : public TrackError
{
public:
  UnknownCodeError(const std::string& code, const std::string& message)
    : TrackError{message}, code_{code}
  {
  }

  const std::string& code() const
  {
    return code_;
  }

private:
  std::string code_;
};

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_TRACK_ERRORS_HPP
