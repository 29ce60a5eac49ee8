#include <squall/persist/block_file.h>
#include <squall/persist/persist_exception.h>
#include <squall/io/fd.h>
#include <squall/varint/varint.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

/*
 * Print the header of the block at the given offset in a block file,
 * followed by the offset of its payload.
 */
int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << (argc >= 1 ? argv[0] : "print_header")
        << " /path/to/block/file [offset]\n";
    return 1;
  }

  squall::io::fd::offset_type off = 0;
  if (argc == 3) {
    try {
      std::size_t end;
      off = std::stoull(argv[2], &end);
      if (argv[2][end] != '\0') throw std::invalid_argument(argv[2]);
    } catch (const std::logic_error&) {
      std::cerr << "invalid offset: " << argv[2] << "\n";
      return 1;
    }
  }

  try {
    const auto file = squall::io::fd(argv[1], squall::io::fd::READ_ONLY);
    const auto loc = squall::persist::read_header(file, off);
    const auto& hdr = loc.header;

    std::cout
        << "name:       " << hdr.name() << "\n"
        << "start:      " << hdr.start_time() << "\n"
        << "end:        " << hdr.end_time() << "\n"
        << "type:       " << hdr.data_type() << "\n"
        << "dimensions: " << hdr.dimensions() << "\n"
        << "sources:    " << hdr.sources().size() << "\n";
    for (const auto& source : hdr.sources())
      std::cout << "  " << source << "\n";
    std::cout
        << "count:      " << hdr.data_count() << "\n"
        << "header:     " << (loc.payload_offset - loc.header_offset)
        << " bytes\n"
        << "payload:    " << loc.payload_offset << "\n";
  } catch (const squall::varint::varint_exception& e) {
    std::cerr << argv[1] << ": malformed header at offset " << off
        << ": " << e.what() << "\n";
    return 1;
  } catch (const squall::persist::persist_exception& e) {
    std::cerr << argv[1] << ": invalid header at offset " << off
        << ": " << e.what() << "\n";
    return 1;
  } catch (const std::system_error& e) {
    std::cerr << argv[1] << ": " << e.what() << "\n";
    return 1;
  }

  return 0;
}
