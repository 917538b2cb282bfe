#include "discovery.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identity.hpp"
#include "internal/util/path_utils.hpp"

namespace scribe::discovery {

namespace fs = std::filesystem;

using scribe::model::WorkItem;

namespace {

std::unordered_set<std::string> NormalizeAllowList(const std::vector<std::string>& allow_list) {
  std::unordered_set<std::string> out;
  for (const auto& ext : allow_list) {
    auto lowered = util::ToLower(ext);
    if (!lowered.empty() && lowered.front() != '.') lowered.insert(lowered.begin(), '.');
    out.insert(std::move(lowered));
  }
  return out;
}

void Consider(const fs::directory_entry& entry, const std::unordered_set<std::string>& allowed,
              std::vector<WorkItem>& out) {
  std::error_code ec;
  if (!entry.is_regular_file(ec) || ec) {
    return;
  }

  const auto ext = util::ToLower(entry.path().extension().string());
  if (allowed.count(ext) == 0) {
    return;
  }

  WorkItem item;
  item.path       = fs::absolute(entry.path()).lexically_normal();
  item.size_bytes = entry.file_size(ec);
  if (!ec) item.mtime_ns = util::ModificationTimeNs(item.path, ec);
  if (ec) {
    SCRIBE_LOG_WARN("cannot stat candidate, skipping", {observability::StringField("path", item.path.string()),
                                                       observability::StringField("error", ec.message())});
    return;
  }
  item.identity = util::MakeIdentity(item.path, item.mtime_ns);
  out.push_back(std::move(item));
}

} // namespace

std::vector<WorkItem> Scan(const fs::path& root, bool recursive, const std::vector<std::string>& allow_list) {
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw util::NotFound("input directory does not exist: " + root.string());
  }
  if (!fs::is_directory(root, ec)) {
    throw util::NotADirectory("input path is not a directory: " + root.string());
  }

  const auto            allowed = NormalizeAllowList(allow_list);
  std::vector<WorkItem> items;

  // Unreadable subtrees are skipped rather than failing the whole scan.
  const auto options = fs::directory_options::skip_permission_denied;

  if (recursive) {
    fs::recursive_directory_iterator it(root, options, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      Consider(*it, allowed, items);
    }
  } else {
    fs::directory_iterator it(root, options, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      Consider(*it, allowed, items);
    }
  }
  if (ec) {
    SCRIBE_LOG_WARN("directory scan incomplete", {observability::StringField("root", root.string()),
                                                  observability::StringField("error", ec.message())});
  }

  std::sort(items.begin(), items.end(), [](const WorkItem& a, const WorkItem& b) { return a.path < b.path; });

  SCRIBE_LOG_DEBUG("discovery complete", {observability::StringField("root", root.string()),
                                          observability::IntField("files", static_cast<int64_t>(items.size()))});
  return items;
}

DiscoverySummary Summarize(const std::vector<WorkItem>& items) {
  DiscoverySummary summary;
  for (const auto& item : items) {
    auto& ext = summary.by_extension[util::ToLower(item.path.extension().string())];
    ext.count++;
    ext.bytes += item.size_bytes;

    summary.total_files++;
    summary.total_bytes += item.size_bytes;
  }
  return summary;
}

} // namespace scribe::discovery
