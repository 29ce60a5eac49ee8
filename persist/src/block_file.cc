#include <squall/persist/block_file.h>
#include <squall/io/positional_stream.h>
#include <squall/varint/varint_stream.h>
#include <utility>

namespace squall {
namespace persist {


auto read_header(const io::fd& file, io::fd::offset_type off)
-> header_location {
  auto in = varint::varint_stream_reader<io::positional_reader>(
      io::positional_reader(file, off));
  auto decoded = persisted_data_header::decode(in);

  return header_location{
    std::move(decoded.header),
    off,
    off + decoded.serialized_size
  };
}

auto write_header(io::fd& file, io::fd::offset_type off,
    const persisted_data_header& hdr)
-> io::fd::offset_type {
  const auto orig_size = file.size();

  try {
    auto out = varint::varint_stream_writer<io::positional_writer>(
        io::positional_writer(file, off));
    return off + hdr.encode(out);
  } catch (...) {
    // Drop whatever part of the header landed past the old end of file.
    if (file.size() > orig_size) file.truncate(orig_size);
    throw;
  }
}


}} /* namespace squall::persist */
