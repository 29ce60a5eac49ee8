#ifndef SQUALL_VARINT_VARINT_H
#define SQUALL_VARINT_VARINT_H

#include <squall/misc_export_.h>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace squall {
namespace varint {


/**
 * \brief Decoder for variable length encoded data.
 *
 * Integers are read as base-128 groups, least significant group first,
 * with the high bit of each byte marking a continuation.
 * Signed integers are zig-zag mapped onto their unsigned counterpart.
 * Strings are prefixed with their length in bytes, as a varuint32.
 *
 * The stream tracks the number of bytes consumed, which allows callers
 * to compute the offset of data following an encoded record.
 */
class squall_misc_export_ varint_istream {
 public:
  virtual ~varint_istream() noexcept;

  std::int32_t get_varint32();
  std::int64_t get_varint64();
  std::uint32_t get_varuint32();
  std::uint64_t get_varuint64();

  template<typename Alloc = std::allocator<char>>
      auto get_string(const Alloc& = Alloc())
      -> std::basic_string<char, std::char_traits<char>, Alloc>;

  void get_raw_data(void*, std::size_t);

  ///\brief Read a collection, prefixed by its varint32 element count.
  template<typename C, typename SerFn>
      auto get_collection(SerFn, C&& = C()) -> C&&;
  template<typename SerFn, typename Acceptor>
      void accept_collection_n(std::size_t, SerFn, Acceptor);
  template<typename SerFn, typename Acceptor>
      void accept_collection(SerFn, Acceptor);

  ///\brief Read a varint32 element count.
  ///\throw varint_exception if the count is negative.
  std::size_t get_collection_size();

  ///\brief Number of bytes consumed from this stream.
  std::uint64_t bytes_read() const noexcept { return bytes_read_; }

  virtual bool at_end() const = 0;
  virtual void close() = 0;

 private:
  std::uint8_t get_byte_();
  virtual void get_raw_bytes(void*, std::size_t) = 0;

  std::uint64_t bytes_read_ = 0;
};

/**
 * \brief Encoder for variable length encoded data.
 *
 * Mirrors \ref varint_istream.
 */
class squall_misc_export_ varint_ostream {
 public:
  virtual ~varint_ostream() noexcept;

  void put_varint32(std::int32_t);
  void put_varint64(std::int64_t);
  void put_varuint32(std::uint32_t);
  void put_varuint64(std::uint64_t);

  void put_string(std::string_view);

  ///\brief Write a collection, prefixed by its varint32 element count.
  template<typename SerFn, typename Iter>
      auto put_collection(SerFn, Iter, Iter)
      -> std::enable_if_t<
          std::is_base_of<
            std::forward_iterator_tag,
            typename std::iterator_traits<Iter>::iterator_category>::value,
          void>;

  void put_collection_size(std::size_t);

  void put_raw_data(const void*, std::size_t);

  /**
   * \brief Number of bytes written to this stream.
   *
   * Counts every byte accepted by the underlying stream, including those
   * of a write that was only partially accepted.
   */
  std::uint64_t bytes_written() const noexcept { return bytes_written_; }

  virtual void close() = 0;

 private:
  /**
   * \brief Write up to \p len bytes.
   * \return the number of bytes accepted, zero if the stream refuses more.
   */
  virtual auto put_raw_bytes(const void*, std::size_t) -> std::size_t = 0;

  std::uint64_t bytes_written_ = 0;
};

class squall_misc_export_ varint_exception
: public std::exception
{
 public:
  varint_exception();
  varint_exception(const varint_exception&) = default;
  varint_exception& operator=(const varint_exception&) = default;
  varint_exception(const char* what);
  ~varint_exception() override;

  const char* what() const noexcept override;

 private:
  const char* what_ = nullptr;
};

///\brief Raised when the stream ends in the middle of a value.
class squall_misc_export_ varint_stream_end
: public varint_exception
{
 public:
  varint_stream_end();
  ~varint_stream_end() override;
};


template<typename Alloc = std::allocator<std::uint8_t>>
class varint_bytevector_ostream
: public varint_ostream
{
 public:
  using vector_type = std::vector<std::uint8_t, Alloc>;
  using size_type = typename vector_type::size_type;

  varint_bytevector_ostream() noexcept = default;
  varint_bytevector_ostream(const varint_bytevector_ostream&) = delete;
  varint_bytevector_ostream(varint_bytevector_ostream&&) noexcept;
  explicit varint_bytevector_ostream(const Alloc&);
  ~varint_bytevector_ostream() noexcept override = default;

  void close() override {}

  std::uint8_t* data() noexcept;
  const std::uint8_t* data() const noexcept;
  size_type size() const noexcept;

  vector_type& as_vector() noexcept;
  const vector_type& as_vector() const noexcept;
  void copy_to(varint_ostream&) const;

 private:
  auto put_raw_bytes(const void*, std::size_t) -> std::size_t override;

  vector_type v_;
};

/**
 * \brief Reads from a borrowed range of bytes.
 *
 * The range must outlive the stream.
 */
class squall_misc_export_ varint_bytespan_istream
: public varint_istream
{
 public:
  varint_bytespan_istream() noexcept = default;
  varint_bytespan_istream(const void*, std::size_t) noexcept;
  template<typename Alloc>
  explicit varint_bytespan_istream(const std::vector<std::uint8_t, Alloc>&)
      noexcept;
  ~varint_bytespan_istream() noexcept override;

  bool at_end() const override;
  void close() override;

  std::size_t remaining() const noexcept { return len_; }

 private:
  void get_raw_bytes(void*, std::size_t) override;

  const std::uint8_t* ptr_ = nullptr;
  std::size_t len_ = 0;
};


}} /* namespace squall::varint */

#include "varint-inl.h"

#endif /* SQUALL_VARINT_VARINT_H */
