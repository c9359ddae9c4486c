#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace agentpay::runtime::config {
class RuntimeConfig;
}

namespace agentpay::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Credentials never reach the sink; any field whose key names one is masked.
bool IsSecretFieldKey(std::string_view key);

// key=value pairs separated by spaces. Values containing whitespace, quotes or
// '=' are double-quoted so event details stay on one parseable line.
std::string FormatFields(std::initializer_list<LogField> fields);

// Accepts spdlog level names plus "warning". Throws util::InvalidArgument
// for anything else instead of silently disabling output.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// Level, pattern and trace-context come from the logging section, each
// overridable by AGENTPAY_LOG_LEVEL / AGENTPAY_LOG_PATTERN /
// AGENTPAY_LOG_INCLUDE_TRACE_CONTEXT.
void InitializeLogging(const agentpay::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Skips formatting entirely when the level is filtered out.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace agentpay::observability

#define AGENTPAY_LOG_AT(level, message, ...) ::agentpay::observability::Log((level), (message), ##__VA_ARGS__)
#define AGENTPAY_LOG_DEBUG(message, ...) AGENTPAY_LOG_AT(::spdlog::level::debug, message, ##__VA_ARGS__)
#define AGENTPAY_LOG_INFO(message, ...) AGENTPAY_LOG_AT(::spdlog::level::info, message, ##__VA_ARGS__)
#define AGENTPAY_LOG_WARN(message, ...) AGENTPAY_LOG_AT(::spdlog::level::warn, message, ##__VA_ARGS__)
#define AGENTPAY_LOG_ERROR(message, ...) AGENTPAY_LOG_AT(::spdlog::level::err, message, ##__VA_ARGS__)
