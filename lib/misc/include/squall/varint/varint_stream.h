#ifndef SQUALL_VARINT_VARINT_STREAM_H
#define SQUALL_VARINT_VARINT_STREAM_H

#include <type_traits>
#include <squall/varint/varint.h>

namespace squall {
namespace varint {


/**
 * \brief Adapts an \ref io::stream_reader to a varint_istream.
 * \tparam Reader A stream reader type, held by value.
 */
template<typename Reader>
class varint_stream_reader
: public varint_istream
{
 public:
  varint_stream_reader() = default;

  explicit varint_stream_reader(Reader&&)
      noexcept(std::is_nothrow_move_constructible<Reader>());

  varint_stream_reader(varint_stream_reader&& o)
      noexcept(std::is_nothrow_move_constructible<Reader>());

  varint_stream_reader& operator=(varint_stream_reader&& o)
      noexcept(std::is_nothrow_move_assignable<Reader>());

  bool at_end() const override;
  void close() override;

  const Reader& underlying() const noexcept { return r_; }

 private:
  void get_raw_bytes(void*, std::size_t) override;

  Reader r_;
};


/**
 * \brief Adapts an \ref io::stream_writer to a varint_ostream.
 * \tparam Writer A stream writer type, held by value.
 */
template<typename Writer>
class varint_stream_writer
: public varint_ostream
{
 public:
  varint_stream_writer() = default;

  explicit varint_stream_writer(Writer&&)
      noexcept(std::is_nothrow_move_constructible<Writer>());

  varint_stream_writer(varint_stream_writer&& o)
      noexcept(std::is_nothrow_move_constructible<Writer>());

  varint_stream_writer& operator=(varint_stream_writer&& o)
      noexcept(std::is_nothrow_move_assignable<Writer>());

  void close() override;

  const Writer& underlying() const noexcept { return w_; }

 private:
  auto put_raw_bytes(const void*, std::size_t) -> std::size_t override;

  Writer w_;
};


}} /* namespace squall::varint */

#include "varint_stream-inl.h"

#endif /* SQUALL_VARINT_VARINT_STREAM_H */
