#include "identity.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace scribe::util {

uint64_t Fnv1a64(std::string_view data, uint64_t seed) {
  constexpr uint64_t kPrime = 0x100000001b3ULL;

  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kPrime;
  }
  return hash;
}

std::string MakeIdentity(const std::filesystem::path& absolute_path, int64_t mtime_ns) {
  const std::string key = absolute_path.lexically_normal().string() + "_" + std::to_string(mtime_ns);

  // Two lanes, 128-bit key.
  const uint64_t hi = Fnv1a64(key);
  const uint64_t lo = Fnv1a64(key, hi ^ 0x9e3779b97f4a7c15ULL);

  std::ostringstream out;
  out << std::hex << std::setfill('0') << std::setw(16) << hi << std::setw(16) << lo;
  return out.str();
}

int64_t ModificationTimeNs(const std::filesystem::path& path) {
  const auto mtime = std::filesystem::last_write_time(path);
  return std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
}

int64_t ModificationTimeNs(const std::filesystem::path& path, std::error_code& ec) {
  const auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) return 0;
  return std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
}

} // namespace scribe::util
