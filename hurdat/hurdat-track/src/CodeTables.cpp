// Ticket: 0002_track_normalization

#include "hurdat-track/src/CodeTables.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string>

#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

namespace
{

template <typename Enum, std::size_t N, std::size_t M>
std::optional<Enum> decode(const std::array<CodeEntry<Enum>, N>& table,
                           const std::array<std::string_view, M>& missing,
                           std::string_view code,
                           std::string_view tableName)
{
  if (std::ranges::find(missing, code) != missing.end())
  {
    return std::nullopt;
  }

  auto it = std::ranges::find(table, code, &CodeEntry<Enum>::code);
  if (it == table.end())
  {
    throw UnknownCodeError{
      std::string{code},
      std::format("Unknown {} code '{}'", tableName, code)};
  }
  return it->value;
}

template <typename Enum, std::size_t N>
std::string_view encode(const std::array<CodeEntry<Enum>, N>& table,
                        Enum value)
{
  auto it = std::ranges::find(table, value, &CodeEntry<Enum>::value);
  if (it == table.end())
  {
    throw std::invalid_argument{std::format(
      "No code for enumerator {}", static_cast<unsigned>(value))};
  }
  return it->code;
}

template <typename Record, typename Enum, std::size_t N>
std::vector<Record> toRecords(const std::array<CodeEntry<Enum>, N>& table)
{
  std::vector<Record> records;
  records.reserve(N);
  for (const auto& entry : table)
  {
    Record record{};
    record.code_id = static_cast<uint32_t>(entry.value);
    record.code = std::string{entry.code};
    record.description = std::string{entry.description};
    records.push_back(std::move(record));
  }
  std::ranges::sort(records, {}, &Record::code_id);
  return records;
}

}  // namespace

std::optional<RecordIdentifier> decodeIdentifier(std::string_view code)
{
  return decode(kIdentifierTable, kIdentifierMissingCodes, code, "identifier");
}

std::optional<StormStatus> decodeStatus(std::string_view code)
{
  return decode(kStatusTable, kStatusMissingCodes, code, "status");
}

std::string_view identifierCode(RecordIdentifier identifier)
{
  return encode(kIdentifierTable, identifier);
}

std::string_view statusCode(StormStatus status)
{
  return encode(kStatusTable, status);
}

std::vector<hurdat_transfer::IdentifierCodeRecord> identifierCodeRecords()
{
  return toRecords<hurdat_transfer::IdentifierCodeRecord>(kIdentifierTable);
}

std::vector<hurdat_transfer::StatusCodeRecord> statusCodeRecords()
{
  return toRecords<hurdat_transfer::StatusCodeRecord>(kStatusTable);
}

}  // namespace hurdat_track
