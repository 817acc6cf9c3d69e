#include "snapseek/observability/global.hpp"

#include <mutex>

namespace snapseek::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_ingest_completed(const std::int64_t id, const std::string &filename,
                             const std::uint64_t size_bytes,
                             const std::chrono::milliseconds duration) {
  record_event(IngestCompletedEvent{
      .id = id, .filename = filename, .size_bytes = size_bytes, .duration = duration});
}

void record_ingest_failed(const std::string &stage, const std::string &kind,
                          const std::string &message) {
  record_event(IngestFailedEvent{.stage = stage, .kind = kind, .message = message});
}

void record_search_completed(const std::string &query, const std::size_t candidates,
                             const std::size_t returned,
                             const std::chrono::milliseconds duration) {
  record_event(SearchCompletedEvent{
      .query = query, .candidates = candidates, .returned = returned, .duration = duration});
}

void record_item_skipped(const std::int64_t id, const std::string &reason) {
  record_event(ItemSkippedEvent{.id = id, .reason = reason});
}

void record_cleanup(const std::string &storage_ref, const bool success) {
  record_event(CleanupEvent{.storage_ref = storage_ref, .success = success});
}

void record_inference(const std::string &backend, const std::string &operation,
                      const std::chrono::milliseconds latency) {
  record_metric(
      InferenceLatencyMetric{.backend = backend, .operation = operation, .latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace snapseek::observability
