#ifndef SQUALL_VARINT_VARINT_INL_H
#define SQUALL_VARINT_VARINT_INL_H

#include <algorithm>
#include <cstring>
#include <limits>
#include <utility>

namespace squall {
namespace varint {
namespace detail {


constexpr std::uint32_t zigzag_encode(std::int32_t v) noexcept {
  return (static_cast<std::uint32_t>(v) << 1) ^
      static_cast<std::uint32_t>(v >> 31);
}

constexpr std::uint64_t zigzag_encode(std::int64_t v) noexcept {
  return (static_cast<std::uint64_t>(v) << 1) ^
      static_cast<std::uint64_t>(v >> 63);
}

constexpr std::int32_t zigzag_decode(std::uint32_t u) noexcept {
  const std::uint32_t magnitude = u >> 1;
  if ((u & 1u) == 0u)
    return static_cast<std::int32_t>(magnitude);
  else // -(magnitude + 1), without overflowing on INT32_MIN
    return -static_cast<std::int32_t>(magnitude) - 1;
}

constexpr std::int64_t zigzag_decode(std::uint64_t u) noexcept {
  const std::uint64_t magnitude = u >> 1;
  if ((u & 1u) == 0u)
    return static_cast<std::int64_t>(magnitude);
  else // -(magnitude + 1), without overflowing on INT64_MIN
    return -static_cast<std::int64_t>(magnitude) - 1;
}


} /* namespace squall::varint::detail */


inline std::int32_t varint_istream::get_varint32() {
  return detail::zigzag_decode(get_varuint32());
}

inline std::int64_t varint_istream::get_varint64() {
  return detail::zigzag_decode(get_varuint64());
}

template<typename Alloc>
auto varint_istream::get_string(const Alloc& alloc)
-> std::basic_string<char, std::char_traits<char>, Alloc> {
  // Grow the string while reading, so a corrupt length prefix
  // runs into the end of the stream instead of a huge allocation.
  constexpr std::size_t CHUNK = 65536u;

  std::basic_string<char, std::char_traits<char>, Alloc> result =
      std::basic_string<char, std::char_traits<char>, Alloc>(alloc);

  std::size_t len = get_varuint32();
  while (len > 0u) {
    const std::size_t rlen = std::min(len, CHUNK);
    const std::size_t off = result.size();
    result.resize(off + rlen);
    get_raw_data(result.data() + off, rlen);
    len -= rlen;
  }
  return result;
}

template<typename C, typename SerFn>
auto varint_istream::get_collection(SerFn fn, C&& c) -> C&& {
  accept_collection(std::move(fn),
      [&c](auto&& v) {
        c.insert(c.end(), std::forward<decltype(v)>(v));
      });
  return std::forward<C>(c);
}

template<typename SerFn, typename Acceptor>
void varint_istream::accept_collection_n(std::size_t len, SerFn fn,
    Acceptor acceptor) {
  for (std::size_t i = 0; i < len; ++i)
    acceptor(fn(*this));
}

template<typename SerFn, typename Acceptor>
void varint_istream::accept_collection(SerFn fn, Acceptor acceptor) {
  accept_collection_n(get_collection_size(),
      std::move(fn),
      std::move(acceptor));
}


inline void varint_ostream::put_varint32(std::int32_t v) {
  put_varuint32(detail::zigzag_encode(v));
}

inline void varint_ostream::put_varint64(std::int64_t v) {
  put_varuint64(detail::zigzag_encode(v));
}

inline void varint_ostream::put_varuint32(std::uint32_t v) {
  put_varuint64(v);
}

template<typename SerFn, typename Iter>
auto varint_ostream::put_collection(SerFn fn, Iter b, Iter e)
-> std::enable_if_t<
    std::is_base_of<
      std::forward_iterator_tag,
      typename std::iterator_traits<Iter>::iterator_category>::value,
    void> {
  put_collection_size(std::distance(b, e));
  while (b != e) fn(*this, *b++);
}


template<typename Alloc>
varint_bytevector_ostream<Alloc>::varint_bytevector_ostream(
    varint_bytevector_ostream&& o) noexcept
: varint_ostream(std::move(o)),
  v_(std::move(o.v_))
{}

template<typename Alloc>
varint_bytevector_ostream<Alloc>::varint_bytevector_ostream(const Alloc& alloc)
: v_(alloc)
{}

template<typename Alloc>
std::uint8_t* varint_bytevector_ostream<Alloc>::data() noexcept {
  return v_.data();
}

template<typename Alloc>
const std::uint8_t* varint_bytevector_ostream<Alloc>::data() const noexcept {
  return v_.data();
}

template<typename Alloc>
auto varint_bytevector_ostream<Alloc>::size() const noexcept -> size_type {
  return v_.size();
}

template<typename Alloc>
auto varint_bytevector_ostream<Alloc>::as_vector() noexcept -> vector_type& {
  return v_;
}

template<typename Alloc>
auto varint_bytevector_ostream<Alloc>::as_vector() const noexcept
-> const vector_type& {
  return v_;
}

template<typename Alloc>
void varint_bytevector_ostream<Alloc>::copy_to(varint_ostream& out) const {
  out.put_raw_data(v_.data(), v_.size());
}

template<typename Alloc>
auto varint_bytevector_ostream<Alloc>::put_raw_bytes(const void* buf,
    std::size_t len)
-> std::size_t {
  const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(buf);
  v_.insert(v_.end(), p, p + len);
  return len;
}


template<typename Alloc>
varint_bytespan_istream::varint_bytespan_istream(
    const std::vector<std::uint8_t, Alloc>& v) noexcept
: varint_bytespan_istream(v.data(), v.size())
{}


}} /* namespace squall::varint */

#endif /* SQUALL_VARINT_VARINT_INL_H */
