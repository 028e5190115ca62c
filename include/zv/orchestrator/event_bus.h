#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "zv/config.h"

namespace zv::orchestrator {

  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  // kRedact replaces the value with "[REDACTED]", kHash with a SHA-256 tag.
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

  // Lowercase SHA-256 hex, or "" for empty input.
  std::string HashForTelemetry(std::string_view input);

  // Serializes |event| as one compact JSON object with privacy rules applied.
  // Returns nullopt when the result would exceed |max_bytes|.
  std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                            size_t max_bytes);

  // Appends one JSON object per line. Rotates to <path>.1 .. <path>.3 once the
  // next line would push the file past |max_bytes|.
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(const config::EngineConfig& cfg);
    explicit JsonLineLogger(std::filesystem::path log_path, size_t max_bytes = 0);
    void Log(const Event& event);

    // Closes the current file; later lines go to |log_path|.
    void Retarget(std::filesystem::path log_path, size_t max_bytes);

    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    static constexpr size_t kMaxFiles = 3;
    uint64_t dropped_streak_{0};
  };

  // Process-wide logger behind the default subscriber. Built from
  // LoadFromEnvironment() on first use.
  JsonLineLogger& DefaultJsonLogger();
  // Points the default logger at cfg.log_dir/zerovault.log.
  void ConfigureDefaultLogger(const config::EngineConfig& cfg);

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Subscribers run synchronously on the publishing thread.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting();

} // namespace zv::orchestrator
