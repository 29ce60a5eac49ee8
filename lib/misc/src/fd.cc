#include <squall/io/fd.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace squall {
namespace io {
namespace {


void throw_errno_() {
  throw std::system_error(errno, std::system_category());
}

int open_flags_(fd::open_mode mode) noexcept {
  int fl = 0;
#ifdef O_CLOEXEC
  fl |= O_CLOEXEC;
#endif
  switch (mode) {
    case fd::READ_ONLY:
      fl |= O_RDONLY;
      break;
    case fd::WRITE_ONLY:
      fl |= O_WRONLY;
      break;
    case fd::READ_WRITE:
      fl |= O_RDWR;
      break;
  }
  return fl;
}


} /* namespace squall::io::<anonymous> */


fd::fd() noexcept
: handle_(-1)
{}

fd::fd(fd&& o) noexcept
: handle_(std::exchange(o.handle_, -1)),
  mode_(o.mode_)
{}

fd::fd(const std::string& fname, open_mode mode)
: handle_(-1),
  mode_(mode)
{
  handle_ = ::open(fname.c_str(), open_flags_(mode));
  if (handle_ == -1) throw_errno_();

  try {
    struct stat sb;
    if (::fstat(handle_, &sb) != 0) throw_errno_();
    if (!S_ISREG(sb.st_mode)) {
      errno = EINVAL;
      throw_errno_();
    }
  } catch (...) {
    close_();
    throw;
  }
}

fd::~fd() noexcept {
  close_();
}

fd fd::tmpfile(const std::string& prefix) {
  namespace filesystem = ::std::filesystem;

  filesystem::path prefix_path = prefix + "XXXXXX";
  if (prefix_path.has_parent_path())
    prefix_path = filesystem::absolute(prefix_path);
  else
    prefix_path = filesystem::temp_directory_path() / prefix_path;

  std::string template_name = prefix_path.native();

  fd new_fd;
  new_fd.handle_ = ::mkstemp(template_name.data());
  if (new_fd.handle_ == -1) throw_errno_();
  new_fd.mode_ = READ_WRITE;
  if (::unlink(template_name.c_str()) != 0) throw_errno_();
  return new_fd;
}

void fd::close_() noexcept {
  if (handle_ != -1) {
    ::close(handle_);
    handle_ = -1;
  }
}

fd::operator bool() const noexcept {
  return handle_ != -1;
}

bool fd::can_read() const noexcept {
  return *this && (mode_ == READ_ONLY || mode_ == READ_WRITE);
}

bool fd::can_write() const noexcept {
  return *this && (mode_ == WRITE_ONLY || mode_ == READ_WRITE);
}

auto fd::size() const -> size_type {
  struct stat sb;

  if (::fstat(handle_, &sb)) throw_errno_();
  return sb.st_size;
}

void fd::truncate(size_type sz) {
  if (::ftruncate(handle_, sz)) throw_errno_();
}

auto fd::read_at(offset_type off, void* buf, std::size_t nbytes) const
-> std::size_t {
  const auto rlen = ::pread(handle_, buf, nbytes, off);
  if (rlen == -1) throw_errno_();
  return rlen;
}

auto fd::write_at(offset_type off, const void* buf, std::size_t nbytes)
-> std::size_t {
  const auto wlen = ::pwrite(handle_, buf, nbytes, off);
  if (wlen == -1) throw_errno_();
  return wlen;
}


}} /* namespace squall::io */
