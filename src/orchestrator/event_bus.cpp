#include "zv/orchestrator/event_bus.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

#include "zv/codec/json.h"
#include "zv/crypto/sha256.h"
#include "zv/error.h"

namespace zv::orchestrator {
namespace {

constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024;
constexpr char kLogFileName[] = "zerovault.log";

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& EventBusSingleton() {
  static std::unique_ptr<EventBus> instance;
  return instance;
}

class PublishScope {
public:
  explicit PublishScope(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishScope() { flag_ = false; }
  PublishScope(const PublishScope&) = delete;
  PublishScope& operator=(const PublishScope&) = delete;

private:
  bool& flag_;
};

// The logger cannot publish its own failures, so they go to stderr.
void ReportLoggerError(std::string_view what, const std::error_code& ec = {}) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << what << "\"";
  if (ec) {
    std::clog << ",\"error_code\":" << ec.value();
  }
  std::clog << "}" << std::endl;
}

size_t ClampLogBytes(uint64_t value) {
  if (value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(std::min<uint64_t>(value, std::numeric_limits<size_t>::max()));
}

std::string HashTag(std::string_view value) {
  return "hash:" + HashForTelemetry(value).substr(0, 16);
}

bool LooksLikeFilesystemPath(std::string_view value) {
  return value.find_first_of("/\\") != std::string_view::npos;
}

bool FieldKeyImpliesSecret(std::string_view key) {
  std::string lowered(key);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  for (std::string_view marker : {"key", "nonce", "salt", "secret", "password"}) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return lowered.rfind("iv", 0) == 0;
}

bool FieldKeyImpliesIdentity(std::string_view key) {
  return key == "user_id" || key == "user" || key == "filename" || key == "path";
}

FieldPrivacy EffectivePrivacy(const EventField& field) {
  if (FieldKeyImpliesSecret(field.key)) {
    return FieldPrivacy::kRedact;
  }
  if (field.privacy == FieldPrivacy::kPublic &&
      (FieldKeyImpliesIdentity(field.key) || LooksLikeFilesystemPath(field.value))) {
    return FieldPrivacy::kHash;
  }
  return field.privacy;
}

// Accumulates one JSON object and gives up once |limit| would be exceeded.
class BoundedObject {
public:
  explicit BoundedObject(size_t limit) : limit_(limit) {
    out_.reserve(std::min<size_t>(limit, 256));
    Raw("{");
  }

  void String(std::string_view key, std::string_view value) {
    Key(key);
    std::string quoted;
    codec::AppendJsonString(quoted, value);
    Raw(quoted);
  }

  void Number(std::string_view key, std::string_view digits) {
    Key(key);
    Raw(digits);
  }

  std::optional<std::string> Finish() {
    Raw("}");
    if (overflow_) {
      return std::nullopt;
    }
    return std::move(out_);
  }

private:
  void Key(std::string_view key) {
    if (members_++ > 0) {
      Raw(",");
    }
    std::string quoted;
    codec::AppendJsonString(quoted, key);
    quoted.push_back(':');
    Raw(quoted);
  }

  void Raw(std::string_view chunk) {
    if (overflow_ || chunk.size() > limit_ - std::min(limit_, out_.size())) {
      overflow_ = true;
      return;
    }
    out_.append(chunk);
  }

  std::string out_;
  size_t limit_;
  size_t members_{0};
  bool overflow_{false};
};

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

Event OversizeMarker(const Event& original) {
  Event marker;
  marker.category = original.category;
  marker.severity = EventSeverity::kWarning;
  marker.event_id = "event_truncated";
  marker.message = "Event exceeded serialization limit";
  if (!original.event_id.empty()) {
    marker.fields.emplace_back("original_event_id", original.event_id);
  }
  marker.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return marker;
}

std::string UtcTimestamp(std::chrono::system_clock::time_point tp) {
  const auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
      << micros.count() << 'Z';
  return oss.str();
}

std::filesystem::path RotatedName(const std::filesystem::path& base, size_t index) {
  if (index == 0) {
    return base;
  }
  return std::filesystem::path(base.string() + "." + std::to_string(index));
}

config::EngineConfig StartupConfig() {
  try {
    return config::LoadFromEnvironment();
  } catch (const zv::Error&) {
    ReportLoggerError("invalid logging configuration, using defaults");
    return config::EngineConfig{};
  }
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return zv::crypto::SHA256_Hex(input);
}

std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                          size_t max_bytes) {
  BoundedObject object(max_bytes);
  object.String("ts", timestamp);
  object.String("severity", SeverityToString(event.severity));
  object.String("category", CategoryToString(event.category));
  if (!event.event_id.empty()) {
    object.String("event_id", event.event_id);
  }
  if (!event.message.empty()) {
    object.String("message",
                  LooksLikeFilesystemPath(event.message) ? HashTag(event.message) : event.message);
  }
  for (const auto& field : event.fields) {
    switch (EffectivePrivacy(field)) {
    case FieldPrivacy::kRedact:
      object.String(field.key, "[REDACTED]");
      break;
    case FieldPrivacy::kHash:
      object.String(field.key, HashTag(field.value));
      break;
    case FieldPrivacy::kPublic:
      if (field.numeric) {
        object.Number(field.key, field.value);
      } else {
        object.String(field.key, field.value);
      }
      break;
    }
  }
  return object.Finish();
}

JsonLineLogger::JsonLineLogger(const config::EngineConfig& cfg)
    : JsonLineLogger(cfg.log_dir / kLogFileName, ClampLogBytes(cfg.log_max_bytes)) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(ClampLogBytes(max_bytes)) {}

void JsonLineLogger::Retarget(std::filesystem::path log_path, size_t max_bytes) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  log_path_ = std::move(log_path);
  max_bytes_ = ClampLogBytes(max_bytes);
  dropped_streak_ = 0;
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  const auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerError("log directory create failed", ec);
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  const auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec || current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  // Oldest generation first: .2 -> .3, .1 -> .2, live -> .1.
  for (size_t idx = kMaxFiles; idx > 0; --idx) {
    const auto src = RotatedName(log_path_, idx - 1);
    const auto dst = RotatedName(log_path_, idx);
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      if (rotate_ec) {
        ReportLoggerError("log rotation stat failed", rotate_ec);
      }
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      ReportLoggerError("log rotate rename failed", rotate_ec);
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto timestamp = UtcTimestamp(std::chrono::system_clock::now());
  auto line = BuildEventJson(event, timestamp, kMaxEventBytes);
  if (!line) {
    line = BuildEventJson(OversizeMarker(event), timestamp, kMaxEventBytes);
    if (!line) {
      return;
    }
  }

  RotateIfNeeded(line->size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    if (dropped_streak_++ == 0) {
      ReportLoggerError("failed to open log file");
    }
    return;
  }
  dropped_streak_ = 0;
  stream_ << *line << '\n';
  stream_.flush();
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger(StartupConfig());
  return logger;
}

void ConfigureDefaultLogger(const config::EngineConfig& cfg) {
  DefaultJsonLogger().Retarget(cfg.log_dir / kLogFileName, ClampLogBytes(cfg.log_max_bytes));
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  auto& instance = EventBusSingleton();
  if (!instance) {
    instance = std::make_unique<EventBus>();
  }
  return *instance;
}

void EventBus::Publish(const Event& event) {
  // A subscriber that publishes would recurse into itself.
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishScope scope(in_publish);
  const auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  EventBusSingleton().reset();
}

} // namespace zv::orchestrator
