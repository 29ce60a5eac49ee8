#include <squall/persist/persisted_data_source.h>
#include <ostream>
#include <utility>

namespace squall {
namespace persist {


auto decode_persisted_data_source_status(std::int32_t v) noexcept
-> persisted_data_source_status {
  switch (v) {
    default:
      return persisted_data_source_status::unknown;
    case static_cast<std::int32_t>(persisted_data_source_status::unavailable):
      return persisted_data_source_status::unavailable;
    case static_cast<std::int32_t>(persisted_data_source_status::available):
      return persisted_data_source_status::available;
    case static_cast<std::int32_t>(persisted_data_source_status::partial):
      return persisted_data_source_status::partial;
  }
}

auto to_string(persisted_data_source_status s) noexcept -> std::string_view {
  switch (s) {
    case persisted_data_source_status::unavailable:
      return "Unavailable";
    case persisted_data_source_status::available:
      return "Available";
    case persisted_data_source_status::partial:
      return "Partial";
    default:
      return "Unknown";
  }
}


persisted_data_source::persisted_data_source(std::string name,
    persisted_data_source_status status)
: name_(std::move(name)),
  status_(status)
{}

auto persisted_data_source::decode(varint::varint_istream& in)
-> persisted_data_source {
  std::string name = in.get_string();
  const auto status = decode_persisted_data_source_status(in.get_varint32());
  return persisted_data_source(std::move(name), status);
}

void persisted_data_source::encode(varint::varint_ostream& out) const {
  out.put_string(name_);
  out.put_varint32(static_cast<std::int32_t>(status_));
}

bool persisted_data_source::operator==(const persisted_data_source& y)
    const noexcept {
  return name_ == y.name_ && status_ == y.status_;
}

bool persisted_data_source::operator!=(const persisted_data_source& y)
    const noexcept {
  return !(*this == y);
}


auto operator<<(std::ostream& out, persisted_data_source_status s)
-> std::ostream& {
  return out << to_string(s);
}

auto operator<<(std::ostream& out, const persisted_data_source& s)
-> std::ostream& {
  return out << s.name() << "(" << s.status() << ")";
}


}} /* namespace squall::persist */
