#ifndef SQUALL_PERSIST_DIMENSION_SET_H
#define SQUALL_PERSIST_DIMENSION_SET_H

///\file
///\ingroup persist

#include <squall/persist/persist_export_.h>
#include <squall/varint/varint.h>
#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace squall {
namespace persist {


/**
 * \brief The dimensional schema of a persisted block.
 * \ingroup persist
 *
 * A dimension set is an ordered list of unique dimension names.
 * Payload samples are keyed by one value per dimension,
 * in the order of this set.
 */
class squall_persist_export_ dimension_set {
 public:
  using name_list = std::vector<std::string>;
  using iterator = name_list::const_iterator;
  using const_iterator = iterator;
  using size_type = name_list::size_type;

  ///\brief Create an empty dimension set.
  dimension_set() = default;
  /**
   * \brief Create a dimension set with the given names.
   * \throw std::invalid_argument if a name occurs more than once.
   */
  dimension_set(std::initializer_list<std::string> names);
  /**
   * \brief Create a dimension set from an iteration of names.
   * \throw std::invalid_argument if a name occurs more than once.
   */
  template<typename Iter> dimension_set(Iter b, Iter e);

  /**
   * \brief Read a dimension set.
   *
   * The encoding is a varint32 count, followed by that many
   * length-prefixed names.
   *
   * \throw varint::varint_exception if the data is malformed.
   * \throw persist_exception if a name occurs more than once.
   */
  static auto decode(varint::varint_istream& in) -> dimension_set;
  ///\brief Write this dimension set.
  void encode(varint::varint_ostream& out) const;

  bool empty() const noexcept { return names_.empty(); }
  size_type size() const noexcept { return names_.size(); }
  iterator begin() const noexcept { return names_.begin(); }
  iterator end() const noexcept { return names_.end(); }
  const name_list& names() const noexcept { return names_; }

  bool contains(std::string_view name) const noexcept;
  ///\brief Position of the named dimension in this set.
  auto index_of(std::string_view name) const noexcept
      -> std::optional<size_type>;

  bool operator==(const dimension_set&) const noexcept;
  bool operator!=(const dimension_set&) const noexcept;

 private:
  explicit dimension_set(name_list&& names) noexcept;

  static auto find_duplicate_(const name_list& names)
      -> const std::string*;
  void validate_() const;

  name_list names_;
};

squall_persist_export_
auto operator<<(std::ostream& out, const dimension_set& d) -> std::ostream&;


}} /* namespace squall::persist */

#include "dimension_set-inl.h"

#endif /* SQUALL_PERSIST_DIMENSION_SET_H */
