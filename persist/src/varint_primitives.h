#ifndef SQUALL_PERSIST_VARINT_PRIMITIVES_H
#define SQUALL_PERSIST_VARINT_PRIMITIVES_H

#include <squall/persist/persist_export_.h>
#include <squall/time_point.h>
#include <squall/varint/varint.h>
#include <cstdint>

namespace squall {
namespace persist {


/* A varint_ostream that discards its data, counting bytes only. */
class squall_persist_local_ size_counting_ostream
: public varint::varint_ostream
{
 public:
  ~size_counting_ostream() noexcept override;

  void close() override {}

 private:
  auto put_raw_bytes(const void*, std::size_t len) -> std::size_t override {
    return len;
  }
};

squall_persist_local_
inline time_point decode_timestamp(varint::varint_istream& in) {
  return time_point(in.get_varint64());
}

squall_persist_local_
inline void encode_timestamp(varint::varint_ostream& out, time_point tp) {
  out.put_varint64(tp.millis_since_posix_epoch());
}


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_VARINT_PRIMITIVES_H */
