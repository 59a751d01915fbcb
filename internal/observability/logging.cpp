#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace relay::observability {
namespace {

constexpr const char* kLoggerName = "dqm-relay";

std::string ResolveLevelName(const relay::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("RELAY_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  // flat key kept for older configuration files
  if (!config.logging_level().empty()) {
    return config.logging_level();
  }

  return "info";
}

std::string ResolvePattern(const relay::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("RELAY_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") {
    return spdlog::level::trace;
  }
  if (lowered == "debug") {
    return spdlog::level::debug;
  }
  if (lowered == "info") {
    return spdlog::level::info;
  }
  if (lowered == "warn" || lowered == "warning") {
    return spdlog::level::warn;
  }
  if (lowered == "err" || lowered == "error") {
    return spdlog::level::err;
  }
  if (lowered == "critical" || lowered == "fatal") {
    return spdlog::level::critical;
  }
  if (lowered == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

void InitializeLogging(const relay::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));

  const auto level_name = ResolveLevelName(config);
  const auto level      = ParseLevel(level_name);
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!level) {
    LogWarn("Unknown logging level, using info", {StringField("level", level_name)});
  }
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

} // namespace relay::observability
