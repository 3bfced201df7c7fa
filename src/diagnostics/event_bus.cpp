#include "kf/diagnostics/event_bus.h"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>

#include "kf/common.h"
#include "kf/crypto/sha256.h"
#include "kf/util/encoding.h"

namespace kf::diagnostics {

namespace {

struct SeverityName {
  EventSeverity severity;
  const char* name;
};

constexpr std::array<SeverityName, 5> kSeverityNames{{
    {EventSeverity::kDebug, "debug"},
    {EventSeverity::kInfo, "info"},
    {EventSeverity::kWarning, "warning"},
    {EventSeverity::kError, "error"},
    {EventSeverity::kCritical, "critical"},
}};

void AppendJsonString(std::string& out, std::string_view text) {
  out.push_back('"');
  for (const unsigned char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(c));
        out += escaped;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  out.push_back('"');
}

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
  std::tm parts{};
#if defined(_WIN32)
  gmtime_s(&parts, &seconds);
#else
  gmtime_r(&seconds, &parts);
#endif
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &parts);
  char stamp[48];
  std::snprintf(stamp, sizeof(stamp), "%s.%03dZ", date, static_cast<int>(millis));
  return stamp;
}

void AppendField(std::string& out, const EventField& field) {
  out.push_back(',');
  AppendJsonString(out, field.key);
  out.push_back(':');
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    out += "\"[redacted]\"";
    return;
  case FieldPrivacy::kHash:
    AppendJsonString(out, HashFieldValue(field.value));
    return;
  case FieldPrivacy::kPublic:
    break;
  }
  if (field.numeric) {
    out += field.value;
  } else {
    AppendJsonString(out, field.value);
  }
}

thread_local int g_publish_depth = 0;

}  // namespace

std::string HashFieldValue(std::string_view input) {
  if (input.empty()) {
    return {};
  }
  const auto digest = kf::crypto::SHA256_Hash(kf::AsByteSpan(input));
  return kf::util::HexEncode(digest);
}

const char* SeverityToString(EventSeverity severity) {
  for (const auto& entry : kSeverityNames) {
    if (entry.severity == severity) {
      return entry.name;
    }
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    break;
  }
  return "diagnostics";
}

EventSeverity ParseSeverity(std::string_view name) {
  std::string lowered(name);
  for (char& ch : lowered) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (lowered == "warn") {
    return EventSeverity::kWarning;
  }
  for (const auto& entry : kSeverityNames) {
    if (lowered == entry.name) {
      return entry.severity;
    }
  }
  return EventSeverity::kInfo;
}

std::string FormatEventJson(const Event& event) {
  std::string line = "{\"ts\":\"" + UtcTimestamp() + "\",\"severity\":\"" +
                     SeverityToString(event.severity) + "\",\"category\":\"" +
                     CategoryToString(event.category) + "\",\"event\":";
  AppendJsonString(line, event.event_id);
  line += ",\"message\":";
  AppendJsonString(line, event.message);
  for (const auto& field : event.fields) {
    AppendField(line, field);
  }
  line.push_back('}');
  return line;
}

JsonLineLogger::JsonLineLogger() : out_(&std::clog), threshold_(EventSeverity::kInfo) {
  if (const char* env = std::getenv("KF_LOG_LEVEL"); env != nullptr && *env != '\0') {
    threshold_ = ParseSeverity(env);
  }
}

JsonLineLogger::JsonLineLogger(std::ostream& out, EventSeverity threshold)
    : out_(&out), threshold_(threshold) {}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < threshold_) {
    return;
  }
  const std::string line = FormatEventJson(event);
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << line << '\n' << std::flush;
}

EventBus::EventBus() { ResetSubscribers(); }

EventBus& EventBus::Instance() {
  static EventBus bus;
  return bus;
}

void EventBus::Publish(const Event& event) {
  if (g_publish_depth > 0) {
    if (event.severity >= EventSeverity::kWarning) {
      std::clog << "[diagnostics] nested publish of " << event.event_id << " dropped\n";
    }
    return;
  }
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = subscribers_;
  }
  ++g_publish_depth;
  struct DepthRestore {
    ~DepthRestore() { --g_publish_depth; }
  } restore;
  for (const auto& subscriber : targets) {
    subscriber(event);
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(std::move(fn));
}

void EventBus::ResetSubscribers() {
  static JsonLineLogger default_sink;
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.clear();
  subscribers_.emplace_back([](const Event& e) { default_sink.Log(e); });
}

void ResetEventBusForTesting() { EventBus::Instance().ResetSubscribers(); }

}  // namespace kf::diagnostics
