#include "ledger.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"

namespace scribe::ledger {

using scribe::v1::LedgerDocument;
using scribe::v1::LedgerEntry;
using scribe::v1::LedgerStatistics;

namespace fs = std::filesystem;

Ledger::Ledger(fs::path path) : path_(std::move(path)) {
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

void Ledger::Load() {
  std::unique_lock lock(mutex_);
  doc_.Clear();

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    SCRIBE_LOG_WARN("ledger unreadable, starting empty", {observability::StringField("path", path_.string())});
    return;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string json = buffer.str();
  if (json.empty()) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  LedgerDocument parsed;
  auto           status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
  if (!status.ok()) {
    SCRIBE_LOG_WARN("ledger corrupt, starting empty",
                    {observability::StringField("path", path_.string()),
                     observability::StringField("error", std::string(status.message()))});
    return;
  }

  doc_.Swap(&parsed);
  SCRIBE_LOG_DEBUG("ledger loaded", {observability::StringField("path", path_.string()),
                                     observability::IntField("entries", doc_.processed_files_size())});
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool Ledger::ShouldSkip(const std::string& identity, const fs::path& output_path) const {
  {
    std::shared_lock lock(mutex_);
    auto             it = doc_.processed_files().find(identity);
    if (it == doc_.processed_files().end() || !it->second.success()) {
      return false;
    }
  }

  std::error_code ec;
  if (!fs::is_regular_file(output_path, ec)) {
    return false;
  }
  const auto size = fs::file_size(output_path, ec);
  return !ec && size > 0;
}

LedgerStatistics Ledger::Stats() const {
  std::shared_lock lock(mutex_);
  return doc_.statistics();
}

std::optional<LedgerEntry> Ledger::Get(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  auto             it = doc_.processed_files().find(identity);
  if (it == doc_.processed_files().end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t Ledger::Size() const {
  std::shared_lock lock(mutex_);
  return static_cast<size_t>(doc_.processed_files_size());
}

std::vector<LedgerEntry> Ledger::FailedEntries() const {
  std::vector<LedgerEntry> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [identity, entry] : doc_.processed_files()) {
      if (!entry.success()) out.push_back(entry);
    }
  }
  // map iteration order is unspecified
  std::sort(out.begin(), out.end(),
            [](const LedgerEntry& a, const LedgerEntry& b) { return a.source_path() < b.source_path(); });
  return out;
}

// ------------------------------------------------------------
// Record
// ------------------------------------------------------------

void Ledger::Record(const std::string& identity, const LedgerEntry& entry) {
  std::unique_lock lock(mutex_);

  // Changes become visible only once they are on disk.
  LedgerDocument next = doc_;
  (*next.mutable_processed_files())[identity] = entry;

  auto* stats = next.mutable_statistics();
  stats->set_total_processed(stats->total_processed() + 1);
  if (entry.success()) {
    stats->set_successful(stats->successful() + 1);
  } else {
    stats->set_failed(stats->failed() + 1);
  }
  stats->set_total_duration(stats->total_duration() + entry.duration());
  stats->set_total_processing_time(stats->total_processing_time() + entry.processing_time());

  Persist(next);
  doc_.Swap(&next);
}

void Ledger::Persist(const LedgerDocument& doc) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(doc, &json, options);
  if (!status.ok()) {
    throw util::PersistenceError("ledger serialization failed: " + std::string(status.message()));
  }

  util::WriteFileAtomic(path_, json);
}

} // namespace scribe::ledger
