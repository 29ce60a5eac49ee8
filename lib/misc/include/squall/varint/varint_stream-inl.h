#ifndef SQUALL_VARINT_VARINT_STREAM_INL_H
#define SQUALL_VARINT_VARINT_STREAM_INL_H

#include <cstdint>
#include <utility>

namespace squall {
namespace varint {


template<typename Reader>
varint_stream_reader<Reader>::varint_stream_reader(Reader&& r)
noexcept(std::is_nothrow_move_constructible<Reader>())
: r_(std::move(r))
{}

template<typename Reader>
varint_stream_reader<Reader>::varint_stream_reader(varint_stream_reader&& o)
noexcept(std::is_nothrow_move_constructible<Reader>())
: varint_istream(o),
  r_(std::move(o.r_))
{}

template<typename Reader>
auto varint_stream_reader<Reader>::operator=(varint_stream_reader&& o)
noexcept(std::is_nothrow_move_assignable<Reader>())
-> varint_stream_reader& {
  static_cast<varint_istream&>(*this) = o;
  r_ = std::move(o.r_);
  return *this;
}

template<typename Reader>
bool varint_stream_reader<Reader>::at_end() const {
  return r_.at_end();
}

template<typename Reader>
void varint_stream_reader<Reader>::close() {
  r_.close();
}

template<typename Reader>
void varint_stream_reader<Reader>::get_raw_bytes(void* buf, std::size_t len) {
  while (len > 0) {
    const std::size_t rlen = r_.read(buf, len);
    if (rlen == 0) throw varint_stream_end();

    len -= rlen;
    buf = reinterpret_cast<std::uint8_t*>(buf) + rlen;
  }
}


template<typename Writer>
varint_stream_writer<Writer>::varint_stream_writer(Writer&& w)
noexcept(std::is_nothrow_move_constructible<Writer>())
: w_(std::move(w))
{}

template<typename Writer>
varint_stream_writer<Writer>::varint_stream_writer(varint_stream_writer&& o)
noexcept(std::is_nothrow_move_constructible<Writer>())
: varint_ostream(o),
  w_(std::move(o.w_))
{}

template<typename Writer>
auto varint_stream_writer<Writer>::operator=(varint_stream_writer&& o)
noexcept(std::is_nothrow_move_assignable<Writer>())
-> varint_stream_writer& {
  static_cast<varint_ostream&>(*this) = o;
  w_ = std::move(o.w_);
  return *this;
}

template<typename Writer>
void varint_stream_writer<Writer>::close() {
  w_.close();
}

template<typename Writer>
auto varint_stream_writer<Writer>::put_raw_bytes(const void* buf,
    std::size_t len)
-> std::size_t {
  return w_.write(buf, len);
}


}} /* namespace squall::varint */

#endif /* SQUALL_VARINT_VARINT_STREAM_INL_H */
