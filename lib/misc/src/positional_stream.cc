#include <squall/io/positional_stream.h>
#include <stdexcept>
#include <string>

namespace squall {
namespace io {
namespace {


template<typename FD>
auto require_open_(FD* file, const char* op) -> FD& {
  if (file == nullptr)
    throw std::logic_error(std::string(op) + " on closed positional stream");
  return *file;
}


} /* namespace squall::io::<anonymous> */


positional_reader::~positional_reader() noexcept {}

std::size_t positional_reader::read(void* buf, std::size_t len) {
  const std::size_t rlen = require_open_(fd_, "read").read_at(off_, buf, len);
  off_ += rlen;
  return rlen;
}

bool positional_reader::at_end() const {
  // Offsets may point past the end of file; nothing can be read there.
  return off_ >= require_open_(fd_, "at_end").size();
}

void positional_reader::close() {
  require_open_(fd_, "close");
  fd_ = nullptr;
}


positional_writer::~positional_writer() noexcept {}

std::size_t positional_writer::write(const void* buf, std::size_t len) {
  const std::size_t wlen =
      require_open_(fd_, "write").write_at(off_, buf, len);
  off_ += wlen;
  return wlen;
}

void positional_writer::close() {
  require_open_(fd_, "close");
  fd_ = nullptr;
}


}} /* namespace squall::io */
