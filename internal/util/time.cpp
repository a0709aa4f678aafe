#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace speechmaker::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FileSafeTimestamp(TimePoint tp) {
  const auto  secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto  millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  std::time_t t      = Clock::to_time_t(secs);

  std::tm utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H-%M-%S") << '-' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

} // namespace speechmaker::util
