#ifndef HISTVAULT_HISTORY_HISTORY_HPP
#define HISTVAULT_HISTORY_HISTORY_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace histvault::history {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

// One executed command. Immutable once created.
struct HistoryRecord {
  std::string id;
  Timestamp timestamp{};
  int64_t duration = -1;  // nanoseconds
  int64_t exit = -1;
  std::string command;
  std::string cwd;
  std::string session;
  std::string hostname;

  // Builds a record with a fresh id and the current time
  static HistoryRecord create(std::string command, std::string cwd, int64_t exit,
                              int64_t duration, std::string session, std::string hostname);
};

bool operator==(const HistoryRecord& lhs, const HistoryRecord& rhs);
bool operator!=(const HistoryRecord& lhs, const HistoryRecord& rhs);


// ---- IDENTIFIERS ----
// Random UUID v4 rendered as 32 lowercase hex digits
std::string uuid_v4();
// "<machine hostname>:<user name>"
std::string default_hostname();


// ---- TIMESTAMPS ----
Timestamp now();
Timestamp epoch();
int64_t to_nanos(Timestamp ts);
Timestamp from_nanos(int64_t nanos);
// RFC 3339 in UTC with nanoseconds, e.g. 2021-04-25T12:34:56.123456789Z
std::string to_rfc3339(Timestamp ts);
// Accepts a 'Z' or +hh:mm/-hh:mm offset and up to 9 fractional digits.
// Throws codec::CodecError on malformed input.
Timestamp from_rfc3339(const std::string& text);

} // namespace histvault::history

#endif // HISTVAULT_HISTORY_HISTORY_HPP
