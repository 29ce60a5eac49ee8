#ifndef SQUALL_PERSIST_PERSISTED_DATA_HEADER_H
#define SQUALL_PERSIST_PERSISTED_DATA_HEADER_H

///\file
///\ingroup persist

#include <squall/persist/persist_export_.h>
#include <squall/persist/dimension_set.h>
#include <squall/persist/persisted_data_source.h>
#include <squall/persist/persisted_data_type.h>
#include <squall/time_point.h>
#include <squall/varint/varint.h>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace squall {
namespace persist {


/**
 * \brief Header of a block of persisted metric samples.
 * \ingroup persist
 *
 * The header names the metric, the time range covered by the block,
 * the type of the samples, the sources that contributed to them,
 * the dimensions by which samples are keyed and the number of
 * samples that follow the header.
 *
 * Encoding, in order:
 * - name: length prefixed string
 * - start time: varint64, milliseconds since the posix epoch
 * - end time: varint64, milliseconds since the posix epoch
 * - data type: varint32 ordinal
 * - sources: varint32 count, followed by each source
 * - dimensions: \ref dimension_set
 * - data count: varuint32
 *
 * Headers are immutable.
 * The number of bytes a header occupies in a stream is not part of the
 * header; it is returned by \ref encode() and \ref decode().
 */
class squall_persist_export_ persisted_data_header {
 public:
  using source_list = std::vector<persisted_data_source>;
  struct decode_result;

  /**
   * \brief Construct a header from its field values.
   *
   * No validation is performed on the time range or the data count.
   */
  persisted_data_header(std::string name,
      time_point start_time, time_point end_time,
      persisted_data_type data_type,
      source_list sources,
      dimension_set dimensions,
      std::uint32_t data_count);

  /**
   * \brief Read a header from \p in.
   *
   * An unrecognized data type ordinal decodes as
   * \ref persisted_data_type::unknown.
   * Failures of nested decoders propagate unchanged.
   *
   * \return the header and the number of bytes it occupied in \p in.
   * \throw varint::varint_exception if the data is malformed or truncated.
   * \throw persist_exception if the decoded dimension set is invalid.
   */
  static auto decode(varint::varint_istream& in) -> decode_result;
  /**
   * \brief Write this header to \p out.
   *
   * The header is staged in memory and handed to \p out in a single write.
   * \return the number of bytes written.
   */
  auto encode(varint::varint_ostream& out) const -> std::uint64_t;
  ///\brief Number of bytes \ref encode() will write.
  auto serialized_size() const -> std::uint64_t;

  const std::string& name() const noexcept { return name_; }
  time_point start_time() const noexcept { return start_time_; }
  time_point end_time() const noexcept { return end_time_; }
  persisted_data_type data_type() const noexcept { return data_type_; }
  const source_list& sources() const noexcept { return sources_; }
  const dimension_set& dimensions() const noexcept { return dimensions_; }
  std::uint32_t data_count() const noexcept { return data_count_; }

  bool operator==(const persisted_data_header&) const noexcept;
  bool operator!=(const persisted_data_header&) const noexcept;

 private:
  void encode_fields_(varint::varint_ostream& out) const;

  std::string name_;
  time_point start_time_, end_time_;
  persisted_data_type data_type_;
  source_list sources_;
  dimension_set dimensions_;
  std::uint32_t data_count_;
};

///\brief A decoded header, with the number of bytes it occupied.
struct persisted_data_header::decode_result {
  persisted_data_header header;
  std::uint64_t serialized_size;
};

squall_persist_export_
auto operator<<(std::ostream& out, const persisted_data_header& h)
-> std::ostream&;


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_PERSISTED_DATA_HEADER_H */
