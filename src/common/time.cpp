#include "cortex/common/time.hpp"

#include "cortex/common/fs.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cortex::common {

namespace {

Result<Timestamp> invalid(const std::string &value) {
  return Result<Timestamp>::failure(
      make_error(ErrorCode::InvalidTimestamp, "Invalid ISO-8601 timestamp: " + value));
}

bool read_digits(const std::string &text, std::size_t &pos, const std::size_t count, int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = text[pos + i];
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  pos += count;
  out = value;
  return true;
}

} // namespace

Timestamp now() { return Clock::now(); }

std::string format_iso8601(const Timestamp value) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
  auto seconds = millis / 1000;
  auto remainder = millis % 1000;
  if (remainder < 0) {
    remainder += 1000;
    seconds -= 1;
  }

  const auto t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << remainder << 'Z';
  return out.str();
}

Result<Timestamp> parse_iso8601(const std::string &raw) {
  const std::string text = trim(raw);
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_digits(text, pos, 4, year) || pos >= text.size() || text[pos++] != '-' ||
      !read_digits(text, pos, 2, month) || pos >= text.size() || text[pos++] != '-' ||
      !read_digits(text, pos, 2, day)) {
    return invalid(raw);
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return invalid(raw);
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  std::chrono::milliseconds fraction{0};
  std::chrono::minutes offset{0};

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
      return invalid(raw);
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || pos >= text.size() || text[pos++] != ':' ||
        !read_digits(text, pos, 2, minute)) {
      return invalid(raw);
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!read_digits(text, pos, 2, second)) {
        return invalid(raw);
      }
    }
    if (hour > 23 || minute > 59 || second > 60) {
      return invalid(raw);
    }

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int millis = 0;
      int scale = 100;
      std::size_t digits = 0;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
        if (scale > 0) {
          millis += (text[pos] - '0') * scale;
          scale /= 10;
        }
        ++pos;
        ++digits;
      }
      if (digits == 0) {
        return invalid(raw);
      }
      fraction = std::chrono::milliseconds(millis);
    }

    if (pos < text.size()) {
      const char zone = text[pos];
      if (zone == 'Z' || zone == 'z') {
        ++pos;
      } else if (zone == '+' || zone == '-') {
        ++pos;
        int offset_hours = 0;
        int offset_minutes = 0;
        if (!read_digits(text, pos, 2, offset_hours)) {
          return invalid(raw);
        }
        if (pos < text.size() && text[pos] == ':') {
          ++pos;
        }
        if (!read_digits(text, pos, 2, offset_minutes)) {
          return invalid(raw);
        }
        offset = std::chrono::minutes(offset_hours * 60 + offset_minutes);
        if (zone == '-') {
          offset = -offset;
        }
      } else {
        return invalid(raw);
      }
    }
    if (pos != text.size()) {
      return invalid(raw);
    }
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t seconds = timegm(&tm);

  Timestamp value = Clock::from_time_t(seconds);
  value += fraction;
  value -= offset;
  return Result<Timestamp>::success(value);
}

} // namespace cortex::common
