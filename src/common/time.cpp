#include <hexref/common/critical.hpp>
#include <hexref/common/time.hpp>

#include <array>
#include <cstdio>
#include <ctime>

namespace hexref::common {

namespace {

std::tm to_tm(const time_point_t when, const bool local) {
  auto seconds = std::chrono::system_clock::to_time_t(when);
  auto out = std::tm{};
  auto* converted =
      local ? localtime_r(&seconds, &out) : gmtime_r(&seconds, &out);
  if (converted == nullptr) {
    critical("failed to convert time point to calendar time");
  }
  return out;
}

std::string format_date(const std::tm& tm) {
  auto buffer = std::array<char, 16>{};
  auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d", &tm);
  return std::string{buffer.data(), written};
}

}  // namespace

std::string local_date_iso(const time_point_t when) {
  return format_date(to_tm(when, true));
}

std::string utc_date_iso(const time_point_t when) {
  return format_date(to_tm(when, false));
}

std::string utc_timestamp_iso(const time_point_t when) {
  auto tm = to_tm(when, false);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    when.time_since_epoch())
                    .count() %
                1000;
  if (millis < 0) {
    millis += 1000;
  }
  auto buffer = std::array<char, 32>{};
  auto written =
      std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S", &tm);
  auto out = std::string{buffer.data(), written};
  auto fraction = std::array<char, 8>{};
  std::snprintf(fraction.data(), fraction.size(), ".%03dZ",
                static_cast<int>(millis));
  out.append(fraction.data());
  return out;
}

}  // namespace hexref::common
