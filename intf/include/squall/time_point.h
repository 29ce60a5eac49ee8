#ifndef SQUALL_TIME_POINT_H
#define SQUALL_TIME_POINT_H

///\file
///\ingroup intf

#include <squall/intf_export_.h>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace squall {


/**
 * \brief A UTC point in time, at millisecond resolution.
 * \ingroup intf
 *
 * Time points carry no time zone offset.
 * Anything finer than a millisecond is not represented.
 *
 * \note Time point uses the unix/posix epoch.
 */
class time_point {
 public:
  class duration;

  time_point() noexcept = default;
  /**
   * \brief Construct a time point at the given offset, in msec, from the unix/posix epoch.
   * \param millis Number of milliseconds since Jan 1, 1970 00:00:00Z.
   */
  explicit constexpr time_point(std::int64_t millis) noexcept;
  /**
   * \brief Construct a time point by parsing the given string.
   * \param s A string representation of the form <tt>YYYY-MM-dd<b>T</b>HH:mm:ss[.sss]<b>Z</b></tt>.
   * \throw std::invalid_argument if \p s is not a valid time point.
   */
  squall_intf_export_ explicit time_point(const std::string& s);

  /**
   * \return the number of milliseconds since posix epoch.
   */
  std::int64_t constexpr millis_since_posix_epoch() const noexcept;

  ///@{
  ///\brief Compare time points.
  constexpr bool operator==(const time_point&) const noexcept;
  constexpr bool operator!=(const time_point&) const noexcept;
  constexpr bool operator<(const time_point&) const noexcept;
  constexpr bool operator>(const time_point&) const noexcept;
  constexpr bool operator<=(const time_point&) const noexcept;
  constexpr bool operator>=(const time_point&) const noexcept;
  ///@}

  ///@{
  ///\brief Add a duration to this time point.
  constexpr time_point& operator+=(const duration&) noexcept;
  ///\brief Subtract a duration from this time point.
  constexpr time_point& operator-=(const duration&) noexcept;
  ///@}

 private:
  std::int64_t millis_ = 0;
};

/**
 * \brief Represents a time duration with millisecond resolution.
 * \ingroup intf
 */
class time_point::duration {
 public:
  duration() noexcept = default;
  explicit constexpr duration(std::int64_t millis) noexcept;
  /**
   * \brief Construct a duration based on the given time points.
   * \param x,y The time points between which to compute the duration, <tt>y - x</tt>.
   */
  constexpr duration(time_point x, time_point y) noexcept;

  ///\brief The number of milliseconds in this duration.
  constexpr std::int64_t millis() const noexcept;

  constexpr bool operator==(const duration&) const noexcept;
  constexpr bool operator!=(const duration&) const noexcept;

  constexpr duration& operator+=(duration) noexcept;
  constexpr duration& operator-=(duration) noexcept;

 private:
  std::int64_t millis_ = 0;
};

constexpr auto operator+(time_point tp, time_point::duration d) noexcept
-> time_point;
constexpr auto operator-(time_point tp, time_point::duration d) noexcept
-> time_point;
constexpr auto operator-(time_point x, time_point y) noexcept
-> time_point::duration;

/**
 * \brief Yield a string representation of the time point.
 * \ingroup intf_io
 * \relates time_point
 */
squall_intf_export_
std::string to_string(time_point);

/**
 * \brief Write the text representation of the time point to a stream.
 * \ingroup intf_io
 *
 * Time points outside the years 1400..9999 are written as
 * <tt>@<i>millis</i>ms</tt>.
 * \relates time_point
 */
squall_intf_export_
auto operator<<(std::ostream& out, time_point tp) -> std::ostream&;


} /* namespace squall */

#include "time_point-inl.h"

#endif /* SQUALL_TIME_POINT_H */
