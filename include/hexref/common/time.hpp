#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace hexref::common {

using time_point_t = std::chrono::system_clock::time_point;
using clock_fn_t = std::function<time_point_t()>;

inline time_point_t system_now() {
  return std::chrono::system_clock::now();
}

/// Calendar date in the process's local timezone, `YYYY-MM-DD`.
std::string local_date_iso(time_point_t when);

/// Calendar date in UTC, `YYYY-MM-DD`.
std::string utc_date_iso(time_point_t when);

/// UTC timestamp with millisecond precision, `YYYY-MM-DDTHH:MM:SS.mmmZ`.
std::string utc_timestamp_iso(time_point_t when);

}  // namespace hexref::common
