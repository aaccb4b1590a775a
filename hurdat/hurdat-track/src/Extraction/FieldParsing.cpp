// Ticket: 0001_hurdat2_record_extraction

#include "hurdat-track/src/Extraction/FieldParsing.hpp"

#include <charconv>
#include <system_error>

namespace hurdat_track::detail
{

namespace
{

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

// from_chars does not accept a leading '+'
std::string_view dropPlusSign(std::string_view text)
{
  if (!text.empty() && text.front() == '+')
  {
    text.remove_prefix(1);
  }
  return text;
}

template <typename T, typename... Args>
std::optional<T> parseWhole(std::string_view text, Args... args)
{
  text = dropPlusSign(trim(text));
  if (text.empty())
  {
    return std::nullopt;
  }

  T value{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value, args...);
  if (ec != std::errc{} || ptr != end)
  {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::vector<std::string_view> splitFields(std::string_view line)
{
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true)
  {
    const std::size_t comma = line.find(',', start);
    if (comma == std::string_view::npos)
    {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  return fields;
}

std::string_view trimLeft(std::string_view text)
{
  const auto first = text.find_first_not_of(kWhitespace);
  return first == std::string_view::npos ? std::string_view{}
                                         : text.substr(first);
}

std::string_view trimRight(std::string_view text)
{
  const auto last = text.find_last_not_of(kWhitespace);
  return last == std::string_view::npos ? std::string_view{}
                                        : text.substr(0, last + 1);
}

std::string_view trim(std::string_view text)
{
  return trimLeft(trimRight(text));
}

std::string_view stripLeadingSpaces(std::string_view text)
{
  const auto first = text.find_first_not_of(' ');
  return first == std::string_view::npos ? std::string_view{}
                                         : text.substr(first);
}

std::string_view slice(std::string_view text, std::size_t pos, std::size_t count)
{
  if (pos >= text.size())
  {
    return {};
  }
  return text.substr(pos, count);
}

std::string_view lastChars(std::string_view text, std::size_t count)
{
  return text.size() <= count ? text : text.substr(text.size() - count);
}

std::optional<int> parseInteger(std::string_view text)
{
  return parseWhole<int>(text, 10);
}

std::optional<double> parseDecimal(std::string_view text)
{
  return parseWhole<double>(text, std::chars_format::fixed);
}

}  // namespace hurdat_track::detail
