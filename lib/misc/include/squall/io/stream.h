#ifndef SQUALL_IO_STREAM_H
#define SQUALL_IO_STREAM_H

#include <squall/misc_export_.h>
#include <cstdlib>

namespace squall {
namespace io {


class squall_misc_export_ stream_reader {
 public:
  virtual ~stream_reader() noexcept;
  virtual std::size_t read(void*, std::size_t) = 0;
  virtual void close() = 0;
  virtual bool at_end() const = 0;
};

class squall_misc_export_ stream_writer {
 public:
  virtual ~stream_writer() noexcept;
  virtual std::size_t write(const void*, std::size_t) = 0;
  virtual void close() = 0;
};


}} /* namespace squall::io */

#endif /* SQUALL_IO_STREAM_H */
