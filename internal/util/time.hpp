#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace scribe::util {

/*
  Clock helpers shared by the pipeline, ledger and reporting.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

// Local time, second precision: 2024-05-01T13:45:10
std::string ToIso8601(TimePoint tp);

double SecondsSince(SteadyClock::time_point start);

} // namespace scribe::util
