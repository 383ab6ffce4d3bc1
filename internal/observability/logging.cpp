#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace favorites::observability {
namespace {

constexpr const char* kLoggerName     = "favorites";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
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

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  // from_str() maps every unknown name to "off"
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

void InitializeLogging(const favorites::runtime::config::RuntimeConfig& config) {
  const auto& section = config.logging();

  std::string level_name = "info";
  if (const char* env = NonEmptyEnv("FAVORITES_LOG_LEVEL")) {
    level_name = env;
  } else if (!section.level().empty()) {
    level_name = section.level();
  }

  std::string pattern = kDefaultPattern;
  if (const char* env = NonEmptyEnv("FAVORITES_LOG_PATTERN")) {
    pattern = env;
  } else if (!section.pattern().empty()) {
    pattern = section.pattern();
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!section.file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(section.file()));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);

  const auto level = ParseLevel(level_name);
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  if (!level) {
    FAVORITES_LOG_WARN("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace favorites::observability
