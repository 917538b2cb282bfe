#pragma once

#include <string>

namespace scribe::output {

/*
  Timestamp rendering shared by every output format.

  Hours, minutes and seconds come from the truncated whole seconds;
  milliseconds are trunc(fraction * 1000). Negative input clamps to zero.

    3725.25 -> "01:02:05" / "01:02:05,250" / "01:02:05.250"
*/
std::string FormatClock(double seconds);
std::string FormatSubtitleTimestamp(double seconds);
std::string FormatWebSubtitleTimestamp(double seconds);

} // namespace scribe::output
