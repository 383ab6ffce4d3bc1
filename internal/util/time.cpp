#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace favorites::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatLocal(std::int64_t epoch_seconds, const char* pattern) {
  const auto seconds = static_cast<std::time_t>(epoch_seconds);
  std::tm    local{};
  localtime_r(&seconds, &local);

  std::ostringstream out;
  out << std::put_time(&local, pattern);
  return out.str();
}

std::string FormatLocal(TimePoint tp, const char* pattern) {
  return FormatLocal(ToUnixSeconds(tp), pattern);
}

} // namespace favorites::util
