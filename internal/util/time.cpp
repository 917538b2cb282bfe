#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace scribe::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

double SecondsSince(SteadyClock::time_point start) {
  return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

} // namespace scribe::util
