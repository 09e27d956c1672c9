#include "history/history.hpp"
#include "codec/codec_error.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/log/trivial.hpp>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace histvault::history {

namespace {

constexpr int64_t NANOS_PER_SECOND = 1000000000;
constexpr int64_t SECONDS_PER_DAY = 86400;

// Howard Hinnant's days_from_civil / civil_from_days
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tuple<int64_t, unsigned, unsigned> civil_from_days(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {y + (m <= 2), m, d};
}

int64_t floor_div(int64_t value, int64_t divisor) {
  int64_t q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

[[noreturn]] void malformed(const std::string& text, const char* why) {
  throw codec::CodecError("Malformed timestamp '" + text + "': " + why);
}

int parse_digits(const std::string& text, std::size_t pos, std::size_t count) {
  if (pos + count > text.size()) {
    malformed(text, "truncated");
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      malformed(text, "expected digit");
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

void expect_char(const std::string& text, std::size_t pos, char a, char b = '\0') {
  if (pos >= text.size() || (text[pos] != a && (b == '\0' || text[pos] != b))) {
    malformed(text, "unexpected separator");
  }
}

} // namespace

//==============================================
// RECORD CONSTRUCTION
//==============================================

HistoryRecord HistoryRecord::create(std::string command, std::string cwd, int64_t exit,
                                    int64_t duration, std::string session, std::string hostname) {
  HistoryRecord record;
  record.id = uuid_v4();
  record.timestamp = now();
  record.duration = duration;
  record.exit = exit;
  record.command = std::move(command);
  record.cwd = std::move(cwd);
  record.session = std::move(session);
  record.hostname = std::move(hostname);
  return record;
}

bool operator==(const HistoryRecord& lhs, const HistoryRecord& rhs) {
  return lhs.id == rhs.id
      && lhs.timestamp == rhs.timestamp
      && lhs.duration == rhs.duration
      && lhs.exit == rhs.exit
      && lhs.command == rhs.command
      && lhs.cwd == rhs.cwd
      && lhs.session == rhs.session
      && lhs.hostname == rhs.hostname;
}

bool operator!=(const HistoryRecord& lhs, const HistoryRecord& rhs) {
  return !(lhs == rhs);
}

//==============================================
// IDENTIFIERS
//==============================================

std::string uuid_v4() {
  thread_local boost::uuids::random_generator generator;
  const boost::uuids::uuid id = generator();

  std::stringstream ss;
  for (auto byte : id) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string default_hostname() {
  std::string host;
  try {
    host = boost::asio::ip::host_name();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "History: Failed to read machine hostname: " << e.what();
    host = "localhost";
  }

  const char* user = std::getenv("USER");
  if (!user || !*user) {
    user = std::getenv("LOGNAME");
  }
  return host + ":" + ((user && *user) ? user : "unknown");
}

//==============================================
// TIMESTAMPS
//==============================================

Timestamp now() {
  return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}

Timestamp epoch() {
  return Timestamp{};
}

int64_t to_nanos(Timestamp ts) {
  return ts.time_since_epoch().count();
}

Timestamp from_nanos(int64_t nanos) {
  return Timestamp{std::chrono::nanoseconds{nanos}};
}

std::string to_rfc3339(Timestamp ts) {
  const int64_t nanos = to_nanos(ts);
  const int64_t seconds = floor_div(nanos, NANOS_PER_SECOND);
  const int64_t fraction = nanos - seconds * NANOS_PER_SECOND;
  const int64_t days = floor_div(seconds, SECONDS_PER_DAY);
  const int64_t second_of_day = seconds - days * SECONDS_PER_DAY;

  auto [year, month, day] = civil_from_days(days);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%09lldZ",
                static_cast<long long>(year), month, day,
                static_cast<long long>(second_of_day / 3600),
                static_cast<long long>((second_of_day / 60) % 60),
                static_cast<long long>(second_of_day % 60),
                static_cast<long long>(fraction));
  return buffer;
}

Timestamp from_rfc3339(const std::string& text) {
  // YYYY-MM-DDTHH:MM:SS
  const int year = parse_digits(text, 0, 4);
  expect_char(text, 4, '-');
  const int month = parse_digits(text, 5, 2);
  expect_char(text, 7, '-');
  const int day = parse_digits(text, 8, 2);
  expect_char(text, 10, 'T', 't');
  const int hour = parse_digits(text, 11, 2);
  expect_char(text, 13, ':');
  const int minute = parse_digits(text, 14, 2);
  expect_char(text, 16, ':');
  const int second = parse_digits(text, 17, 2);

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    malformed(text, "field out of range");
  }

  std::size_t pos = 19;
  int64_t fraction = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        fraction = fraction * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      malformed(text, "empty fraction");
    }
    for (std::size_t i = digits; i < 9; ++i) {
      fraction *= 10;
    }
  }

  int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    const int offset_hours = parse_digits(text, pos + 1, 2);
    expect_char(text, pos + 3, ':');
    const int offset_minutes = parse_digits(text, pos + 4, 2);
    offset_seconds = sign * (offset_hours * 3600 + offset_minutes * 60);
    pos += 6;
  } else {
    malformed(text, "missing UTC offset");
  }

  if (pos != text.size()) {
    malformed(text, "trailing characters");
  }

  const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t seconds = days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second - offset_seconds;
  return from_nanos(seconds * NANOS_PER_SECOND + fraction);
}

} // namespace histvault::history
