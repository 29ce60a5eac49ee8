#include <squall/persist/dimension_set.h>
#include <squall/persist/persist_exception.h>
#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace squall {
namespace persist {


dimension_set::dimension_set(std::initializer_list<std::string> names)
: names_(names)
{
  validate_();
}

dimension_set::dimension_set(name_list&& names) noexcept
: names_(std::move(names))
{}

auto dimension_set::decode(varint::varint_istream& in) -> dimension_set {
  auto names = in.get_collection<name_list>(
      [](varint::varint_istream& in) {
        return in.get_string();
      });

  const std::string* dup = find_duplicate_(names);
  if (dup != nullptr)
    throw persist_exception("duplicate dimension: " + *dup);
  return dimension_set(std::move(names));
}

void dimension_set::encode(varint::varint_ostream& out) const {
  out.put_collection(
      [](varint::varint_ostream& out, const std::string& name) {
        out.put_string(name);
      },
      names_.begin(), names_.end());
}

bool dimension_set::contains(std::string_view name) const noexcept {
  return index_of(name).has_value();
}

auto dimension_set::index_of(std::string_view name) const noexcept
-> std::optional<size_type> {
  const auto pos = std::find(names_.begin(), names_.end(), name);
  if (pos == names_.end()) return {};
  return static_cast<size_type>(pos - names_.begin());
}

bool dimension_set::operator==(const dimension_set& y) const noexcept {
  return names_ == y.names_;
}

bool dimension_set::operator!=(const dimension_set& y) const noexcept {
  return !(*this == y);
}

auto dimension_set::find_duplicate_(const name_list& names)
-> const std::string* {
  std::unordered_set<std::string_view> seen;
  for (const std::string& name : names) {
    if (!seen.insert(name).second) return &name;
  }
  return nullptr;
}

void dimension_set::validate_() const {
  const std::string* dup = find_duplicate_(names_);
  if (dup != nullptr)
    throw std::invalid_argument("duplicate dimension: " + *dup);
}


auto operator<<(std::ostream& out, const dimension_set& d) -> std::ostream& {
  bool first = true;
  for (const auto& name : d) {
    out << (std::exchange(first, false) ? "{" : ", ")
        << name;
  }
  return out << (first ? "{}" : "}");
}


}} /* namespace squall::persist */
