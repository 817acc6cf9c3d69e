#pragma once

#include "snapseek/observability/observer.hpp"

#include <memory>

namespace snapseek::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_ingest_completed(std::int64_t id, const std::string &filename,
                             std::uint64_t size_bytes, std::chrono::milliseconds duration);
void record_ingest_failed(const std::string &stage, const std::string &kind,
                          const std::string &message);
void record_search_completed(const std::string &query, std::size_t candidates,
                             std::size_t returned, std::chrono::milliseconds duration);
void record_item_skipped(std::int64_t id, const std::string &reason);
void record_cleanup(const std::string &storage_ref, bool success);
void record_inference(const std::string &backend, const std::string &operation,
                      std::chrono::milliseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace snapseek::observability
