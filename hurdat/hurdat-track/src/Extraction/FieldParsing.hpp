// Ticket: 0001_hurdat2_record_extraction

#ifndef HURDAT_TRACK_FIELD_PARSING_HPP
#define HURDAT_TRACK_FIELD_PARSING_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace hurdat_track::detail
{

/// Split on every comma; "a,b," yields {"a", "b", ""}.
std::vector<std::string_view> splitFields(std::string_view line);

std::string_view trimLeft(std::string_view text);
std::string_view trimRight(std::string_view text);
std::string_view trim(std::string_view text);

/// Remove leading spaces only (tabs and other whitespace are kept).
std::string_view stripLeadingSpaces(std::string_view text);

/// Substring that clamps instead of throwing when pos/count overrun.
std::string_view slice(std::string_view text,
                       std::size_t pos,
                       std::size_t count = std::string_view::npos);

/// Last `count` characters, or the whole text if it is shorter.
std::string_view lastChars(std::string_view text, std::size_t count);

/**
 * @brief Parse a base-10 integer surrounded by optional whitespace
 * @return std::nullopt unless the whole trimmed text is one integer
 */
std::optional<int> parseInteger(std::string_view text);

/**
 * @brief Parse a fixed-notation decimal surrounded by optional whitespace
 * @return std::nullopt unless the whole trimmed text is one number
 */
std::optional<double> parseDecimal(std::string_view text);

}  // namespace hurdat_track::detail

#endif  // HURDAT_TRACK_FIELD_PARSING_HPP
