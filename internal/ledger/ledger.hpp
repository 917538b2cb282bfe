#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "scribe/v1.hpp"

namespace scribe::ledger {

/*
  Persisted per-file processing history.

  One entry per identity; a newer attempt replaces the older one. The whole
  document is rewritten atomically after every Record, inside the writer
  lock, so a crash leaves either the previous or the new document on disk.
  A Record whose write fails leaves memory unchanged as well.
*/
class Ledger {
 public:
  explicit Ledger(std::filesystem::path path);

  // Reads the document from disk. A missing, unreadable or corrupt file
  // yields an empty ledger.
  void Load();

  bool ShouldSkip(const std::string& identity, const std::filesystem::path& output_path) const;

  // Throws PersistenceError when the document cannot be written.
  void Record(const std::string& identity, const scribe::v1::LedgerEntry& entry);

  scribe::v1::LedgerStatistics             Stats() const;
  std::optional<scribe::v1::LedgerEntry>   Get(const std::string& identity) const;
  size_t                                   Size() const;
  std::vector<scribe::v1::LedgerEntry>     FailedEntries() const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  // Caller holds the writer lock.
  void Persist(const scribe::v1::LedgerDocument& doc) const;

  std::filesystem::path path_;

  mutable std::shared_mutex  mutex_;
  scribe::v1::LedgerDocument doc_;
};

} // namespace scribe::ledger
