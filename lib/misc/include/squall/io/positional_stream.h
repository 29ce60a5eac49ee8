#ifndef SQUALL_IO_POSITIONAL_STREAM_H
#define SQUALL_IO_POSITIONAL_STREAM_H

#include <squall/misc_export_.h>
#include <squall/io/fd.h>
#include <squall/io/stream.h>

namespace squall {
namespace io {


/**
 * \brief Reads a file starting at a given offset.
 *
 * The reader keeps its own offset; the file offset of the descriptor
 * is not used.
 */
class squall_misc_export_ positional_reader
: public stream_reader
{
 public:
  positional_reader() = default;
  positional_reader(const positional_reader&) = default;
  positional_reader(const fd& fd, fd::offset_type = 0) noexcept;
  positional_reader& operator=(const positional_reader&) = default;

  ~positional_reader() noexcept override;

  std::size_t read(void*, std::size_t) override;
  bool at_end() const override;
  void close() override;

  fd::offset_type offset() const noexcept { return off_; }

 private:
  const fd* fd_ = nullptr;
  fd::offset_type off_ = 0;
};

/**
 * \brief Writes a file starting at a given offset.
 */
class squall_misc_export_ positional_writer
: public stream_writer
{
 public:
  positional_writer() = default;
  positional_writer(const positional_writer&) = default;
  positional_writer(fd& fd, fd::offset_type = 0) noexcept;
  positional_writer& operator=(const positional_writer&) = default;

  ~positional_writer() noexcept override;

  std::size_t write(const void*, std::size_t) override;
  void close() override;

  fd::offset_type offset() const noexcept { return off_; }

 private:
  fd* fd_ = nullptr;
  fd::offset_type off_ = 0;
};


}} /* namespace squall::io */

#include "positional_stream-inl.h"

#endif /* SQUALL_IO_POSITIONAL_STREAM_H */
