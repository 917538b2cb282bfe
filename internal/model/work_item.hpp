#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace scribe::model {

/*
  One discovered input file. Immutable once discovery has produced it.
*/
struct WorkItem {
  std::filesystem::path path;  // absolute, lexically normal
  uint64_t              size_bytes = 0;
  int64_t               mtime_ns   = 0;
  std::string           identity;
};

} // namespace scribe::model
