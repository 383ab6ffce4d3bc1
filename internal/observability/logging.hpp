#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace favorites::runtime::config {
class RuntimeConfig;
}

namespace favorites::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces; values with spaces, '=' or quotes
// are double-quoted and escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

// nullopt for names spdlog does not know.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

/*
  Installs the default "favorites" logger: stdout, plus logging.file when
  set. FAVORITES_LOG_LEVEL / FAVORITES_LOG_PATTERN override the config.
  Safe to call again; the previous logger is replaced.
*/
void InitializeLogging(const favorites::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace favorites::observability

#define FAVORITES_LOG_DEBUG(message, ...) ::favorites::observability::LogDebug((message), ##__VA_ARGS__)
#define FAVORITES_LOG_INFO(message, ...) ::favorites::observability::LogInfo((message), ##__VA_ARGS__)
#define FAVORITES_LOG_WARN(message, ...) ::favorites::observability::LogWarn((message), ##__VA_ARGS__)
#define FAVORITES_LOG_ERROR(message, ...) ::favorites::observability::LogError((message), ##__VA_ARGS__)
