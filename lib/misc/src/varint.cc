#include <squall/varint/varint.h>
#include <algorithm>
#include <array>
#include <limits>

namespace squall {
namespace varint {


varint_istream::~varint_istream() noexcept {}

std::uint8_t varint_istream::get_byte_() {
  std::uint8_t b;
  get_raw_data(&b, 1);
  return b;
}

std::uint32_t varint_istream::get_varuint32() {
  std::uint32_t v = 0;
  for (unsigned int shift = 0; shift < 35u; shift += 7u) {
    const std::uint8_t b = get_byte_();
    // Fifth byte only holds the 4 most significant bits.
    if (shift == 28u && (b & 0xf0u) != 0u)
      throw varint_exception("varuint32 overflow");

    v |= static_cast<std::uint32_t>(b & 0x7fu) << shift;
    if ((b & 0x80u) == 0u) return v;
  }

  throw varint_exception("varuint32 overflow"); // Unreachable.
}

std::uint64_t varint_istream::get_varuint64() {
  std::uint64_t v = 0;
  for (unsigned int shift = 0; shift < 70u; shift += 7u) {
    const std::uint8_t b = get_byte_();
    // Tenth byte only holds the most significant bit.
    if (shift == 63u && (b & 0xfeu) != 0u)
      throw varint_exception("varuint64 overflow");

    v |= static_cast<std::uint64_t>(b & 0x7fu) << shift;
    if ((b & 0x80u) == 0u) return v;
  }

  throw varint_exception("varuint64 overflow"); // Unreachable.
}

void varint_istream::get_raw_data(void* buf, std::size_t len) {
  get_raw_bytes(buf, len);
  bytes_read_ += len;
}

std::size_t varint_istream::get_collection_size() {
  const std::int32_t len = get_varint32();
  if (len < 0) throw varint_exception("negative collection size");
  return static_cast<std::size_t>(len);
}


varint_ostream::~varint_ostream() noexcept {}

void varint_ostream::put_varuint64(std::uint64_t v) {
  std::array<std::uint8_t, 10> buf;
  std::size_t len = 0;

  while (v >= 0x80u) {
    buf[len++] = static_cast<std::uint8_t>(v | 0x80u);
    v >>= 7;
  }
  buf[len++] = static_cast<std::uint8_t>(v);

  put_raw_data(buf.data(), len);
}

void varint_ostream::put_string(std::string_view s) {
  if (s.size() > std::numeric_limits<std::uint32_t>::max())
    throw varint_exception("string too long");

  put_varuint32(static_cast<std::uint32_t>(s.size()));
  put_raw_data(s.data(), s.size());
}

void varint_ostream::put_collection_size(std::size_t len) {
  if (len > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
    throw varint_exception("collection too large");

  put_varint32(static_cast<std::int32_t>(len));
}

void varint_ostream::put_raw_data(const void* buf, std::size_t len) {
  while (len > 0) {
    const std::size_t wlen = put_raw_bytes(buf, len);
    if (wlen == 0) throw varint_exception("write rejected by stream");

    bytes_written_ += wlen;
    len -= wlen;
    buf = reinterpret_cast<const std::uint8_t*>(buf) + wlen;
  }
}


varint_exception::varint_exception() {}

varint_exception::varint_exception(const char* what)
: what_(what)
{}

varint_exception::~varint_exception() {}

const char* varint_exception::what() const noexcept {
  return (what_ == nullptr ? "squall::varint::varint_exception" : what_);
}


varint_stream_end::varint_stream_end()
: varint_exception("squall::varint::varint_stream_end")
{}

varint_stream_end::~varint_stream_end() {}


varint_bytespan_istream::varint_bytespan_istream(const void* ptr,
    std::size_t len) noexcept
: ptr_(reinterpret_cast<const std::uint8_t*>(ptr)),
  len_(len)
{}

varint_bytespan_istream::~varint_bytespan_istream() noexcept {}

bool varint_bytespan_istream::at_end() const {
  return len_ == 0u;
}

void varint_bytespan_istream::close() {
  ptr_ = nullptr;
  len_ = 0;
}

void varint_bytespan_istream::get_raw_bytes(void* buf, std::size_t len) {
  if (len > len_) throw varint_stream_end();

  std::copy_n(ptr_, len, reinterpret_cast<std::uint8_t*>(buf));
  ptr_ += len;
  len_ -= len;
}


}} /* namespace squall::varint */
