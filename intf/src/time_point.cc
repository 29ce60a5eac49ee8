#include <squall/time_point.h>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <locale>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace squall {

using namespace boost::posix_time;
using namespace boost::gregorian;

inline namespace time_point_internals {


// 1400-01-01T00:00:00Z
constexpr std::int64_t MIN_PRINTABLE_MILLIS = -17987443200000ll;
// 9999-12-31T23:59:59.999Z
constexpr std::int64_t MAX_PRINTABLE_MILLIS = 253402300799999ll;

squall_intf_local_ auto unix_epoch() -> ptime;
squall_intf_local_ void imbue_tp_out_format(std::basic_ios<char>& out);
squall_intf_local_ void imbue_tp_in_format(std::basic_ios<char>& out);
squall_intf_local_ auto parse_as_msec_since_posix_epoch(const std::string&)
    -> std::int64_t;


} /* namespace squall::(inline)time_point_internals */


time_point::time_point(const std::string& s)
: time_point(parse_as_msec_since_posix_epoch(s))
{}

std::string to_string(time_point tp) {
  std::ostringstream oss;
  oss << tp;
  return oss.str();
}

auto operator<<(std::ostream& out, time_point tp) -> std::ostream& {
  // Outside the gregorian calendar range, print the raw millisecond count.
  if (tp.millis_since_posix_epoch() < MIN_PRINTABLE_MILLIS
      || tp.millis_since_posix_epoch() > MAX_PRINTABLE_MILLIS)
    return out << "@" << tp.millis_since_posix_epoch() << "ms";

  std::ostringstream oss;
  imbue_tp_out_format(oss);
  oss << (unix_epoch() + milliseconds(tp.millis_since_posix_epoch()));
  return out << oss.str();
}


inline namespace time_point_internals {


const auto FORMAT = "%Y-%m-%dT%H:%M:%S%FZ";

void imbue_tp_out_format(std::basic_ios<char>& out) {
  auto fmt = std::make_unique<time_facet>();
  fmt->format(FORMAT);
  out.imbue(std::locale(std::locale::classic(), fmt.release()));
}

void imbue_tp_in_format(std::basic_ios<char>& out) {
  auto fmt = std::make_unique<time_input_facet>();
  fmt->format(FORMAT);
  out.imbue(std::locale(std::locale::classic(), fmt.release()));
}

auto unix_epoch() -> ptime {
  return ptime(date(1970, 1, 1), time_duration(0, 0, 0));
}

auto parse_as_msec_since_posix_epoch(const std::string& s) -> std::int64_t {
  std::istringstream iss = std::istringstream(s);
  imbue_tp_in_format(iss);

  ptime pval;
  iss >> pval;
  if (iss.fail() || pval.is_special())
    throw std::invalid_argument("invalid time point: " + s);
  return (pval - unix_epoch()).total_milliseconds();
}


} /* namespace squall::time_point_internals */
} /* namespace squall */
