#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace docsync::runtime::config {
class RuntimeConfig;
}

namespace docsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

/*
  Structured logging handle.

  Every component receives one at construction. Messages are rendered as
  "<message> key=value key=value".
*/
class Logger {
 public:
  explicit Logger(std::shared_ptr<spdlog::logger> sink);

  void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) const;

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::debug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::info, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::warn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::err, message, fields);
  }

  void Flush() const;

 private:
  std::shared_ptr<spdlog::logger> sink_;
};

// stderr logger configured from env and the logging section of the config.
std::shared_ptr<Logger> MakeLogger(const docsync::runtime::config::RuntimeConfig& config);

// Discards everything. Used by tests.
std::shared_ptr<Logger> MakeNullLogger();

} // namespace docsync::observability

#define DOCSYNC_LOG_DEBUG(logger, message, ...) (logger).Debug((message), ##__VA_ARGS__)
#define DOCSYNC_LOG_INFO(logger, message, ...) (logger).Info((message), ##__VA_ARGS__)
#define DOCSYNC_LOG_WARN(logger, message, ...) (logger).Warn((message), ##__VA_ARGS__)
#define DOCSYNC_LOG_ERROR(logger, message, ...) (logger).Error((message), ##__VA_ARGS__)
