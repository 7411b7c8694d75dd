#include "core/clock.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_remote::clock {

namespace {

std::time_t utc_to_time_t(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

bool utc_from_time_t(std::time_t t, std::tm* out) {
#ifdef _WIN32
  return gmtime_s(out, &t) == 0;
#else
  return gmtime_r(&t, out) != nullptr;
#endif
}

}  // namespace

Timestamp now() {
  return std::chrono::system_clock::now();
}

int64_t to_unix_seconds(const Timestamp& ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_unix_seconds(int64_t seconds) {
  return Timestamp(std::chrono::seconds(seconds));
}

std::string format_iso8601(const Timestamp& ts) {
  auto since_epoch = ts.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();
  if (millis < 0) {
    secs -= std::chrono::seconds(1);
    millis += 1000;
  }

  std::tm tm{};
  if (!utc_from_time_t(static_cast<std::time_t>(secs.count()), &tm)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  out << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec,
                  &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  size_t pos = static_cast<size_t>(consumed);

  // Fractional seconds, any precision (chrono-style nanoseconds included)
  std::chrono::nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int64_t scale = 100000000;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
      scale /= 10;
      ++pos;
    }
  }

  int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int hours = 0;
    int minutes = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
      return std::nullopt;
    }
    offset_seconds = (hours * 3600 + minutes * 60) * (text[pos] == '-' ? -1 : 1);
    pos += 6;
  } else {
    return std::nullopt;
  }

  if (pos != text.size()) {
    return std::nullopt;
  }

  std::time_t t = utc_to_time_t(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  auto ts = from_unix_seconds(static_cast<int64_t>(t) - offset_seconds);
  return ts + std::chrono::duration_cast<Timestamp::duration>(fraction);
}

}  // namespace mcp_remote::clock
