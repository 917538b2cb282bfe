#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "internal/model/work_item.hpp"

namespace scribe::discovery {

struct ExtensionSummary {
  uint64_t count = 0;
  uint64_t bytes = 0;
};

struct DiscoverySummary {
  uint64_t                                total_files = 0;
  uint64_t                                total_bytes = 0;
  std::map<std::string, ExtensionSummary> by_extension;
};

/*
  Candidate files under root whose extension (case-insensitive, with the
  leading dot) is in allow_list. Sorted by normalized absolute path so two
  scans of the same tree return the same order.

  Throws NotFound when root is missing, NotADirectory when it is a file.
*/
std::vector<scribe::model::WorkItem> Scan(const std::filesystem::path& root, bool recursive,
                                          const std::vector<std::string>& allow_list);

DiscoverySummary Summarize(const std::vector<scribe::model::WorkItem>& items);

} // namespace scribe::discovery
