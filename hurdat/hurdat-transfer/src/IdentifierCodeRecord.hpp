// Ticket: 0003_track_transfer_records

#ifndef HURDAT_TRANSFER_IDENTIFIER_CODE_RECORD_HPP
#define HURDAT_TRANSFER_IDENTIFIER_CODE_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hurdat_transfer
{

/**
 * @brief Lookup row for the observation record identifier ("L" = landfall...)
 *
 * @see hurdat_track::RecordIdentifier
 * @ticket 0003_track_transfer_records
 */
struct IdentifierCodeRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t code_id{0};
  std::string code;  // Single source character
  std::string description;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(IdentifierCodeRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (code_id, code, description));

}  // namespace hurdat_transfer

#endif  // HURDAT_TRANSFER_IDENTIFIER_CODE_RECORD_HPP
