#ifndef SQUALL_IO_FD_H
#define SQUALL_IO_FD_H

#include <squall/misc_export_.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace squall {
namespace io {


/**
 * \brief Owning wrapper around a posix file descriptor.
 *
 * Block files are accessed by offset, using read_at() and write_at(),
 * so multiple positional streams can share the same descriptor.
 */
class squall_misc_export_ fd {
 public:
  using implementation_type = int;
  enum open_mode {
    READ_ONLY,
    WRITE_ONLY,
    READ_WRITE
  };

  using size_type = std::uint64_t;
  using offset_type = size_type;

  fd() noexcept;
  fd(const fd&) = delete;
  fd(fd&&) noexcept;
  fd& operator=(const fd&) = delete;
  ///\brief Open an existing regular file.
  ///\throw std::system_error if the file cannot be opened.
  fd(const std::string&, open_mode);
  ~fd() noexcept;

  ///\brief Create an anonymous temporary file.
  ///\note The file is unlinked on creation and disappears when closed.
  static fd tmpfile(const std::string&);

  explicit operator bool() const noexcept;
  bool is_open() const noexcept { return static_cast<bool>(*this); }
  bool can_read() const noexcept;
  bool can_write() const noexcept;

  size_type size() const;
  void truncate(size_type);

  std::size_t read_at(offset_type, void*, std::size_t) const;
  std::size_t write_at(offset_type, const void*, std::size_t);

 private:
  void close_() noexcept;

  implementation_type handle_;
  open_mode mode_ = READ_ONLY;
};


}} /* namespace squall::io */

#endif /* SQUALL_IO_FD_H */
