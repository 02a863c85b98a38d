#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config/config.pb.h"

namespace docsync::observability {
namespace {

std::string ResolveLevel(const docsync::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DOCSYNC_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const docsync::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DOCSYNC_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

Logger::Logger(std::shared_ptr<spdlog::logger> sink) : sink_(std::move(sink)) {
}

void Logger::Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) const {
  if (!sink_->should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    sink_->log(level, "{} {}", message, serialized_fields);
    return;
  }
  sink_->log(level, "{}", message);
}

void Logger::Flush() const {
  sink_->flush();
}

std::shared_ptr<Logger> MakeLogger(const docsync::runtime::config::RuntimeConfig& config) {
  auto sink = std::make_shared<spdlog::logger>("docsync", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  sink->set_pattern(ResolvePattern(config));
  sink->set_level(spdlog::level::from_str(ResolveLevel(config)));
  sink->flush_on(spdlog::level::warn);
  return std::make_shared<Logger>(std::move(sink));
}

std::shared_ptr<Logger> MakeNullLogger() {
  auto sink = std::make_shared<spdlog::logger>("docsync-null", std::make_shared<spdlog::sinks::null_sink_mt>());
  sink->set_level(spdlog::level::off);
  return std::make_shared<Logger>(std::move(sink));
}

} // namespace docsync::observability
