#include <squall/persist/persisted_data_type.h>
#include <ostream>

namespace squall {
namespace persist {


auto decode_persisted_data_type(std::int32_t v) noexcept
-> persisted_data_type {
  switch (v) {
    default:
      return persisted_data_type::unknown;
    case ordinal(persisted_data_type::hit_count):
      return persisted_data_type::hit_count;
    case ordinal(persisted_data_type::variable_encoded_histogram):
      return persisted_data_type::variable_encoded_histogram;
  }
}

auto to_string(persisted_data_type t) noexcept -> std::string_view {
  switch (t) {
    case persisted_data_type::hit_count:
      return "HitCount";
    case persisted_data_type::variable_encoded_histogram:
      return "VariableEncodedHistogram";
    default:
      return "Unknown";
  }
}

auto operator<<(std::ostream& out, persisted_data_type t) -> std::ostream& {
  return out << to_string(t);
}


}} /* namespace squall::persist */
