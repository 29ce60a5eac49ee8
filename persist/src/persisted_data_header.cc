#include <squall/persist/persisted_data_header.h>
#include "varint_primitives.h"
#include <ostream>
#include <utility>

namespace squall {
namespace persist {


size_counting_ostream::~size_counting_ostream() noexcept {}


persisted_data_header::persisted_data_header(std::string name,
    time_point start_time, time_point end_time,
    persisted_data_type data_type,
    source_list sources,
    dimension_set dimensions,
    std::uint32_t data_count)
: name_(std::move(name)),
  start_time_(start_time),
  end_time_(end_time),
  data_type_(data_type),
  sources_(std::move(sources)),
  dimensions_(std::move(dimensions)),
  data_count_(data_count)
{}

auto persisted_data_header::decode(varint::varint_istream& in)
-> decode_result {
  const std::uint64_t start = in.bytes_read();

  std::string name = in.get_string();
  const time_point start_time = decode_timestamp(in);
  const time_point end_time = decode_timestamp(in);
  const persisted_data_type data_type =
      decode_persisted_data_type(in.get_varint32());
  source_list sources =
      in.get_collection<source_list>(&persisted_data_source::decode);
  dimension_set dimensions = dimension_set::decode(in);
  const std::uint32_t data_count = in.get_varuint32();

  return decode_result{
    persisted_data_header(
        std::move(name),
        start_time, end_time,
        data_type,
        std::move(sources),
        std::move(dimensions),
        data_count),
    in.bytes_read() - start
  };
}

auto persisted_data_header::encode(varint::varint_ostream& out) const
-> std::uint64_t {
  varint::varint_bytevector_ostream<> staged;
  encode_fields_(staged);

  const std::uint64_t start = out.bytes_written();
  staged.copy_to(out);
  return out.bytes_written() - start;
}

auto persisted_data_header::serialized_size() const -> std::uint64_t {
  size_counting_ostream counter;
  encode_fields_(counter);
  return counter.bytes_written();
}

void persisted_data_header::encode_fields_(varint::varint_ostream& out)
    const {
  out.put_string(name_);
  encode_timestamp(out, start_time_);
  encode_timestamp(out, end_time_);
  out.put_varint32(ordinal(data_type_));
  out.put_collection(
      [](varint::varint_ostream& out, const persisted_data_source& source) {
        source.encode(out);
      },
      sources_.begin(), sources_.end());
  dimensions_.encode(out);
  out.put_varuint32(data_count_);
}

bool persisted_data_header::operator==(const persisted_data_header& y)
    const noexcept {
  return name_ == y.name_
      && start_time_ == y.start_time_
      && end_time_ == y.end_time_
      && data_type_ == y.data_type_
      && sources_ == y.sources_
      && dimensions_ == y.dimensions_
      && data_count_ == y.data_count_;
}

bool persisted_data_header::operator!=(const persisted_data_header& y)
    const noexcept {
  return !(*this == y);
}


auto operator<<(std::ostream& out, const persisted_data_header& h)
-> std::ostream& {
  out << h.name()
      << " [" << h.start_time() << ", " << h.end_time() << "]"
      << " " << h.data_type()
      << " sources=";

  bool first = true;
  for (const auto& source : h.sources())
    out << (std::exchange(first, false) ? "[" : ", ") << source;
  out << (first ? "[]" : "]");

  return out << " dimensions=" << h.dimensions()
      << " count=" << h.data_count();
}


}} /* namespace squall::persist */
