#ifndef SQUALL_IO_POSITIONAL_STREAM_INL_H
#define SQUALL_IO_POSITIONAL_STREAM_INL_H

namespace squall {
namespace io {


inline positional_reader::positional_reader(const fd& fd, fd::offset_type off)
noexcept
: fd_(&fd),
  off_(off)
{}

inline positional_writer::positional_writer(fd& fd, fd::offset_type off)
noexcept
: fd_(&fd),
  off_(off)
{}


}} /* namespace squall::io */

#endif /* SQUALL_IO_POSITIONAL_STREAM_INL_H */
