#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace scribe::util {

// Replaces characters that are not valid in a filename on common hosts.
std::string SanitizeFilename(std::string_view name);

/*
  Output path mirroring the source's position under input_root, with a new
  extension. Each relative component is sanitized. Sources outside
  input_root map to output_root/<filename>.
*/
std::filesystem::path MirrorPath(const std::filesystem::path& input_root, const std::filesystem::path& output_root,
                                 const std::filesystem::path& source, std::string_view extension);

/*
  Moves source into dir under the first free name: name.ext, name_1.ext,
  name_2.ext, ... Each name is claimed atomically, so concurrent movers never
  replace an existing file or each other's. Falls back to copy + remove
  across filesystems. Throws filesystem_error; returns the destination.
*/
std::filesystem::path MoveToUniqueDestination(const std::filesystem::path& source, const std::filesystem::path& dir);

std::string ToLower(std::string_view value);

} // namespace scribe::util
