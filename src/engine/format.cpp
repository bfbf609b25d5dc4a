#include "ttl_cache/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ttl_cache {

// 1500ms -> "1.5s", 100s -> "1m40s", 250ms -> "250ms".
std::string format_duration(Duration d) {
  auto ms = d.count();
  if (ms == 0)
    return "0s";
  std::ostringstream os;
  if (ms < 0) {
    os << '-';
    ms = -ms;
  }
  if (ms < 1000) {
    os << ms << "ms";
    return os.str();
  }
  const auto hours = ms / 3600000;
  const auto minutes = (ms / 60000) % 60;
  const auto seconds = (ms / 1000) % 60;
  const auto frac = ms % 1000;
  if (hours)
    os << hours << 'h';
  if (hours || minutes)
    os << minutes << 'm';
  os << seconds;
  if (frac) {
    std::ostringstream f;
    f << std::setw(3) << std::setfill('0') << frac;
    auto digits = f.str();
    digits.erase(digits.find_last_not_of('0') + 1);
    os << '.' << digits;
  }
  os << 's';
  return os.str();
}

std::string format_time_point(TimePoint tp) {
  const auto t = Clock::to_time_t(tp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << ms << 'Z';
  return os.str();
}

} // namespace ttl_cache
