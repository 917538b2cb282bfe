#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace scribe::observability {
namespace {

constexpr std::uint64_t kDefaultMaxLogBytes = 10 * 1024 * 1024;
constexpr std::uint32_t kDefaultBackupCount = 5;

std::string ResolveLevel(const scribe::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SCRIBE_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const scribe::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SCRIBE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveConsoleOutput(const scribe::runtime::config::RuntimeConfig& config) {
  if (config.processing().quiet()) {
    return false;
  }
  return !config.logging().has_console_output() || config.logging().console_output();
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out.precision(3);
  out << std::fixed << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const scribe::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;

  if (ResolveConsoleOutput(config)) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  const auto& logging = config.logging();
  if (!logging.file().empty()) {
    try {
      const std::filesystem::path log_path(logging.file());
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      const auto max_size = logging.max_size_bytes() > 0 ? logging.max_size_bytes() : kDefaultMaxLogBytes;
      const auto backups  = logging.backup_count() > 0 ? logging.backup_count() : kDefaultBackupCount;
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path.string(), max_size, backups));
    } catch (const std::exception& e) {
      spdlog::warn("file logging disabled: {}", e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("mediascribe", sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace scribe::observability
