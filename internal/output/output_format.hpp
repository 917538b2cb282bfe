#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace scribe::output {

enum class OutputFormat : std::uint8_t {
  kText,
  kSubtitle,     // SubRip (.srt)
  kWebSubtitle,  // WebVTT (.vtt)
  kStructured,   // JSON
};

// Accepts txt, srt, vtt, json (case-insensitive).
std::optional<OutputFormat> ParseOutputFormat(std::string_view name);

std::string_view Extension(OutputFormat format);

} // namespace scribe::output
