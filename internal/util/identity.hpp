#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace scribe::util {

/*
  Stable file identity.

  Derived from the absolute path and the modification time, so an edited
  file gets a new identity and is processed again.
*/

std::string MakeIdentity(const std::filesystem::path& absolute_path, int64_t mtime_ns);

int64_t ModificationTimeNs(const std::filesystem::path& path);
int64_t ModificationTimeNs(const std::filesystem::path& path, std::error_code& ec);

// 64-bit FNV-1a.
uint64_t Fnv1a64(std::string_view data, uint64_t seed = 0xcbf29ce484222325ULL);

} // namespace scribe::util
