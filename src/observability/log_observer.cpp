#include "snapseek/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace snapseek::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, IngestCompletedEvent>) {
          log_line("INFO", "ingest.done id=" + std::to_string(evt.id) + " file=" + evt.filename +
                               " bytes=" + std::to_string(evt.size_bytes) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, IngestFailedEvent>) {
          log_line("WARN", "ingest.failed stage=" + evt.stage + " kind=" + evt.kind + " " +
                               evt.message);
        } else if constexpr (std::is_same_v<T, SearchCompletedEvent>) {
          log_line("INFO", "search.done query='" + evt.query +
                               "' candidates=" + std::to_string(evt.candidates) +
                               " returned=" + std::to_string(evt.returned) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ItemSkippedEvent>) {
          log_line("WARN", "search.skip id=" + std::to_string(evt.id) + " " + evt.reason);
        } else if constexpr (std::is_same_v<T, CleanupEvent>) {
          log_line(evt.success ? "DEBUG" : "ERROR",
                   "storage.cleanup ref=" + evt.storage_ref +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InferenceLatencyMetric>) {
          log_line("DEBUG", "metric.inference backend=" + m.backend + " op=" + m.operation +
                                " latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CandidateCountMetric>) {
          log_line("DEBUG", "metric.candidates=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace snapseek::observability
