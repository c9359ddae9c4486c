#include "internal/observability/logging.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace agentpay::observability {
namespace {

constexpr const char* kLoggerName     = "agentpay";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr const char* kRedacted       = "<redacted>";

constexpr std::array<std::string_view, 6> kSecretKeyFragments = {
    "api_token", "bearer", "signing_key", "signature", "secret", "password",
};

std::atomic<bool> g_include_trace_context{false};

std::string Lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) || c == '"' || c == '='; });
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
      case '\r':
        out.append("\\r");
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

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line.append(" trace_id=");
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line.append(" span_id=");
  AppendHex(line, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

bool IsSecretFieldKey(std::string_view key) {
  const auto lowered = Lowercase(key);
  if (lowered == "token") {
    return true;
  }
  return std::any_of(kSecretKeyFragments.begin(), kSecretKeyFragments.end(),
                     [&](std::string_view fragment) { return lowered.find(fragment) != std::string::npos; });
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    if (IsSecretFieldKey(field.key)) {
      out.append(kRedacted);
    } else {
      AppendValue(out, field.value);
    }
  }
  return out;
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  const auto lowered = Lowercase(name);
  if (lowered == "trace") return spdlog::level::trace;
  if (lowered == "debug") return spdlog::level::debug;
  if (lowered == "info") return spdlog::level::info;
  if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
  if (lowered == "error" || lowered == "err") return spdlog::level::err;
  if (lowered == "critical") return spdlog::level::critical;
  if (lowered == "off") return spdlog::level::off;
  throw agentpay::util::InvalidArgument("unknown log level: " + std::string(name));
}

void InitializeLogging(const agentpay::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::string level = logging.level().empty() ? "info" : logging.level();
  if (const char* env = EnvOrNull("AGENTPAY_LOG_LEVEL")) {
    level = env;
  }
  std::string pattern = logging.pattern().empty() ? kDefaultPattern : logging.pattern();
  if (const char* env = EnvOrNull("AGENTPAY_LOG_PATTERN")) {
    pattern = env;
  }
  bool include_trace = logging.include_trace_context();
  if (const char* env = EnvOrNull("AGENTPAY_LOG_INCLUDE_TRACE_CONTEXT")) {
    const auto lowered = Lowercase(env);
    include_trace      = lowered == "1" || lowered == "true";
  }

  // Validate before touching the registry so a bad level leaves logging as it was.
  const auto parsed_level = ParseLogLevel(level);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(parsed_level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(include_trace, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() != 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace agentpay::observability
