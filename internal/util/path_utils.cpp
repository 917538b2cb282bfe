#include "path_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <iterator>
#include <system_error>

namespace scribe::util {

std::string SanitizeFilename(std::string_view name) {
  std::string out;
  out.reserve(name.size());

  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    switch (c) {
      case '<':
      case '>':
      case ':':
      case '"':
      case '|':
      case '?':
      case '*':
      case '/':
      case '\\':
        out.push_back('_');
        break;
      default:
        out.push_back(uc < 0x20 ? '_' : c);
    }
  }

  // Trailing dots and spaces are rejected by some filesystems.
  while (!out.empty() && (out.back() == '.' || out.back() == ' ')) out.pop_back();

  if (out.empty() || out == "." || out == "..") out = "_";
  return out;
}

std::filesystem::path MirrorPath(const std::filesystem::path& input_root, const std::filesystem::path& output_root,
                                 const std::filesystem::path& source, std::string_view extension) {
  const auto root     = input_root.lexically_normal();
  auto       relative = source.lexically_normal().lexically_relative(root);

  if (relative.empty() || relative.begin()->string() == "..") {
    relative = source.filename();
  }

  std::filesystem::path out = output_root;
  const auto            last = std::prev(relative.end());
  for (auto it = relative.begin(); it != relative.end(); ++it) {
    if (it == last) {
      auto stem = it->stem().string();
      out /= SanitizeFilename(stem + std::string(extension));
    } else {
      out /= SanitizeFilename(it->string());
    }
  }
  return out;
}

namespace {

std::filesystem::path Candidate(const std::filesystem::path& dir, const std::filesystem::path& filename,
                                unsigned counter) {
  if (counter == 0) return dir / filename;
  return dir / (filename.stem().string() + "_" + std::to_string(counter) + filename.extension().string());
}

[[noreturn]] void ThrowErrno(const char* what, const std::filesystem::path& from, const std::filesystem::path& to) {
  throw std::filesystem::filesystem_error(what, from, to, std::error_code(errno, std::generic_category()));
}

// Creates an empty placeholder; false when the name is already taken.
bool Claim(const std::filesystem::path& source, const std::filesystem::path& candidate) {
  const int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) return false;
    ThrowErrno("claim destination", source, candidate);
  }
  ::close(fd);
  return true;
}

} // namespace

std::filesystem::path MoveToUniqueDestination(const std::filesystem::path& source, const std::filesystem::path& dir) {
  const auto filename = source.filename();

  for (unsigned counter = 0;; ++counter) {
    const auto candidate = Candidate(dir, filename, counter);

    if (::renameat2(AT_FDCWD, source.c_str(), AT_FDCWD, candidate.c_str(), RENAME_NOREPLACE) == 0) {
      return candidate;
    }
    const int err = errno;
    if (err == EEXIST) continue;
    if (err != EXDEV && err != EINVAL) {
      errno = err;
      ThrowErrno("rename", source, candidate);
    }

    // EINVAL: the filesystem has no RENAME_NOREPLACE. Claim the name first.
    const bool cross_device = err == EXDEV;
    if (!Claim(source, candidate)) continue;

    // The placeholder is ours, so replacing it cannot clobber anyone else's file.
    std::error_code ec;
    if (cross_device) {
      std::filesystem::copy_file(source, candidate, std::filesystem::copy_options::overwrite_existing, ec);
      if (!ec) std::filesystem::remove(source, ec);
    } else {
      std::filesystem::rename(source, candidate, ec);
    }
    if (ec) {
      std::error_code ignored;
      std::filesystem::remove(candidate, ignored);
      throw std::filesystem::filesystem_error("move", source, candidate, ec);
    }
    return candidate;
  }
}

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace scribe::util
