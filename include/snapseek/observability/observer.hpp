#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace snapseek::observability {

struct IngestCompletedEvent {
  std::int64_t id = 0;
  std::string filename;
  std::uint64_t size_bytes = 0;
  std::chrono::milliseconds duration{0};
};

struct IngestFailedEvent {
  std::string stage;
  std::string kind;
  std::string message;
};

struct SearchCompletedEvent {
  std::string query;
  std::size_t candidates = 0;
  std::size_t returned = 0;
  std::chrono::milliseconds duration{0};
};

struct ItemSkippedEvent {
  std::int64_t id = 0;
  std::string reason;
};

struct CleanupEvent {
  std::string storage_ref;
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<IngestCompletedEvent, IngestFailedEvent, SearchCompletedEvent,
                                   ItemSkippedEvent, CleanupEvent, ErrorEvent>;

struct InferenceLatencyMetric {
  std::string backend;
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct CandidateCountMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<InferenceLatencyMetric, CandidateCountMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace snapseek::observability
