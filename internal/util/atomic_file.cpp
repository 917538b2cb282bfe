#include "atomic_file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <system_error>

#include "internal/util/errors.hpp"

namespace scribe::util {

namespace {

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  // Unique per writer so concurrent writers never share a temp file.
  static std::atomic<uint64_t> sequence{0};
  return path.string() + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(sequence.fetch_add(1));
}

[[noreturn]] void Fail(const std::filesystem::path& tmp, const std::string& what, int err) {
  ::unlink(tmp.c_str());
  throw PersistenceError(what + ": " + std::strerror(err));
}

} // namespace

void WriteFileAtomic(const std::filesystem::path& path, std::string_view contents, bool fsync) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw PersistenceError("create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const auto tmp = TempPathFor(path);

  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw PersistenceError("open " + tmp.string() + ": " + std::strerror(errno));
  }

  const char* data      = contents.data();
  size_t      remaining = contents.size();
  while (remaining > 0) {
    const ssize_t n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      Fail(tmp, "write " + tmp.string(), err);
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }

  if (fsync && ::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    Fail(tmp, "fsync " + tmp.string(), err);
  }

  if (::close(fd) != 0) {
    Fail(tmp, "close " + tmp.string(), errno);
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    Fail(tmp, "rename " + tmp.string() + " -> " + path.string(), errno);
  }
}

} // namespace scribe::util
