#pragma once

#include <filesystem>
#include <string_view>

namespace scribe::util {

/*
  Atomic write:
      write tmp → flush → rename

  Readers see either the previous file or the complete new one. Throws
  PersistenceError on any failure; the temp file is removed.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view contents, bool fsync = true);

} // namespace scribe::util
