#pragma once

#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kf::diagnostics {

  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kLifecycle, kSecurity, kDiagnostics };

  // kHash renders the hex SHA-256 of the value; kRedact hides it entirely.
  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // Hex SHA-256 of `input`; empty input stays empty.
  std::string HashFieldValue(std::string_view input);

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Case-insensitive KF_LOG_LEVEL names; unknown names yield kInfo.
  EventSeverity ParseSeverity(std::string_view name);

  // One event as a single-line JSON object, field privacy applied.
  std::string FormatEventJson(const Event& event);

  class JsonLineLogger {
  public:
    JsonLineLogger(); // std::clog, threshold from KF_LOG_LEVEL
    JsonLineLogger(std::ostream& out, EventSeverity threshold);
    void Log(const Event& event);

  private:
    std::mutex mutex_;
    std::ostream* out_;
    EventSeverity threshold_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers to every subscriber in subscription order. A publish from
    // inside a subscriber on the same thread is dropped.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    // Back to the default JSON sink alone.
    void ResetSubscribers();

  private:
    EventBus();

    std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
  };

  void ResetEventBusForTesting();

} // namespace kf::diagnostics
