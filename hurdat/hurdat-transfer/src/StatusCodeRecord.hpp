// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRANSFER_STATUS_CODE_RECORD_HPP
#define HURDAT_TRANSFER_STATUS_CODE_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hurdat_transfer
{

/**
 * @brief Lookup row for the storm status classification ("HU" = hurricane...)
 *
 * @see hurdat_track::StormStatus
 * @ticket 0003_track_transfer_records
 */
struct StatusCodeRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t code_id{0};
  std::string code;  // Two source characters
  std::string description;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(StatusCodeRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (code_id, code, description));

}  // namespace hurdat_transfer

#endif  // HURDAT_TRANSFER_STATUS_CODE_RECORD_HPP
