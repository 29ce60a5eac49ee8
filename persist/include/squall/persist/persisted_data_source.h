#ifndef SQUALL_PERSIST_PERSISTED_DATA_SOURCE_H
#define SQUALL_PERSIST_PERSISTED_DATA_SOURCE_H

///\file
///\ingroup persist

#include <squall/persist/persist_export_.h>
#include <squall/varint/varint.h>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace squall {
namespace persist {


/**
 * \brief Availability of a source at the time a block was written.
 * \ingroup persist
 */
enum class persisted_data_source_status : std::int32_t {
  unknown = 0,
  unavailable = 1,
  available = 2,
  partial = 3
};

/**
 * \brief Map a stored ordinal to a source status.
 * \return the matching status, or
 *   \ref persisted_data_source_status::unknown if not recognized.
 */
squall_persist_export_
auto decode_persisted_data_source_status(std::int32_t ordinal) noexcept
-> persisted_data_source_status;

squall_persist_export_
auto to_string(persisted_data_source_status s) noexcept -> std::string_view;

/**
 * \brief A contributor whose samples were merged into a block.
 * \ingroup persist
 *
 * Encoded as the source name (length prefixed string),
 * followed by the status ordinal (varint32).
 */
class squall_persist_export_ persisted_data_source {
 public:
  persisted_data_source() = default;
  explicit persisted_data_source(std::string name,
      persisted_data_source_status status =
          persisted_data_source_status::unknown);

  static auto decode(varint::varint_istream& in) -> persisted_data_source;
  void encode(varint::varint_ostream& out) const;

  const std::string& name() const noexcept { return name_; }
  persisted_data_source_status status() const noexcept { return status_; }

  bool operator==(const persisted_data_source&) const noexcept;
  bool operator!=(const persisted_data_source&) const noexcept;

 private:
  std::string name_;
  persisted_data_source_status status_ = persisted_data_source_status::unknown;
};

squall_persist_export_
auto operator<<(std::ostream& out, persisted_data_source_status s)
-> std::ostream&;

squall_persist_export_
auto operator<<(std::ostream& out, const persisted_data_source& s)
-> std::ostream&;


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_PERSISTED_DATA_SOURCE_H */
