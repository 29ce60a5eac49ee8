#ifndef SQUALL_PERSIST_PERSISTED_DATA_TYPE_H
#define SQUALL_PERSIST_PERSISTED_DATA_TYPE_H

///\file
///\ingroup persist

#include <squall/persist/persist_export_.h>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace squall {
namespace persist {


/**
 * \brief Type of the samples in a persisted block.
 * \ingroup persist
 *
 * The enumerant values are the ordinals stored in a block header.
 */
enum class persisted_data_type : std::int32_t {
  hit_count = 0,
  variable_encoded_histogram = 1,
  ///\brief Any data type this version does not know about.
  unknown = 2
};

/**
 * \brief Map a stored ordinal to a data type.
 * \return the matching data type, or \ref persisted_data_type::unknown
 *   if the ordinal is not recognized.
 */
squall_persist_export_
auto decode_persisted_data_type(std::int32_t ordinal) noexcept
-> persisted_data_type;

///\brief The ordinal under which \p t is stored.
constexpr auto ordinal(persisted_data_type t) noexcept -> std::int32_t {
  return static_cast<std::int32_t>(t);
}

squall_persist_export_
auto to_string(persisted_data_type t) noexcept -> std::string_view;

squall_persist_export_
auto operator<<(std::ostream& out, persisted_data_type t) -> std::ostream&;


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_PERSISTED_DATA_TYPE_H */
