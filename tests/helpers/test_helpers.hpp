#pragma once

#include "snapseek/config/schema.hpp"
#include "snapseek/models/caption_engine.hpp"
#include "snapseek/models/embedder.hpp"
#include "snapseek/models/http_client.hpp"
#include "snapseek/observability/observer.hpp"
#include "snapseek/storage/record_store.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace snapseek::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Local backends, no observer, everything under the workspace.
config::Config temp_config(const TempWorkspace &workspace, std::size_t dimensions = 128);

/// Number of regular files directly inside `dir` (0 when it does not exist).
std::size_t count_files(const std::filesystem::path &dir);

/// Encoded solid-color image; `extension` is "jpg" or "png". Colors are RGB.
std::string solid_image(int width, int height, int red, int green, int blue,
                        const std::string &extension = "jpg");

/// Single-channel PNG.
std::string gray_png(int width, int height, int level);

class FakeCaptionEngine final : public models::ICaptionEngine {
public:
  explicit FakeCaptionEngine(std::string caption = "a test image");

  void set_caption(std::string caption);
  void set_error(std::string error_message);

  [[nodiscard]] std::string_view name() const override { return "fake"; }
  [[nodiscard]] common::Result<std::string> caption(std::string_view image_bytes) override;

  [[nodiscard]] int calls() const { return calls_.load(); }

private:
  std::mutex mutex_;
  std::string caption_;
  std::optional<std::string> error_;
  std::atomic<int> calls_{0};
};

/// Returns scripted vectors for known texts and a deterministic hashed vector
/// for anything else.
class ScriptedEmbedder final : public models::IEmbedder {
public:
  explicit ScriptedEmbedder(std::size_t dimensions);

  void script(const std::string &text, std::vector<float> vector);
  void set_error(std::string error_message);

  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  [[nodiscard]] int calls() const { return calls_.load(); }

private:
  std::size_t dimensions_;
  std::mutex mutex_;
  std::map<std::string, std::vector<float>> scripted_;
  std::optional<std::string> error_;
  std::atomic<int> calls_{0};
};

class MockHttpClient final : public models::HttpClient {
public:
  models::HttpResponse next_post;
  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::string last_body;
  int post_calls = 0;

  [[nodiscard]] models::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

/// In-memory record store with switchable failures.
class MemoryRecordStore final : public storage::IRecordStore {
public:
  bool fail_create = false;
  bool fail_list = false;

  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Status bind_vector_layout(const storage::VectorLayout &layout) override;
  [[nodiscard]] common::Result<storage::StoredItem>
  create_record(const storage::NewRecord &record) override;
  [[nodiscard]] common::Result<std::vector<storage::StoredItem>> list_all_records() override;
  [[nodiscard]] common::Result<std::vector<storage::StoredItem>>
  list_records(std::size_t offset, std::size_t limit) override;
  [[nodiscard]] common::Result<std::optional<storage::StoredItem>>
  get_record(std::int64_t id) override;
  [[nodiscard]] common::Result<bool> delete_record(std::int64_t id) override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override { return true; }

  /// Inserts a record verbatim, bypassing the pipeline.
  std::int64_t insert_raw(const std::string &caption, const std::string &vector_blob);

  [[nodiscard]] const std::vector<storage::StoredItem> &items() const { return items_; }

private:
  std::vector<storage::StoredItem> items_;
  std::int64_t next_id_ = 1;
  std::optional<storage::VectorLayout> layout_;
};

/// Captures events and metrics; install with observability::set_global_observer.
class RecordingObserver final : public observability::IObserver {
public:
  struct State {
    std::vector<observability::ObserverEvent> events;
    std::vector<observability::ObserverMetric> metrics;
  };

  explicit RecordingObserver(std::shared_ptr<State> state) : state_(std::move(state)) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<State> state_;
};

template <typename Event>
std::size_t count_events(const RecordingObserver::State &state) {
  std::size_t total = 0;
  for (const auto &event : state.events) {
    if (std::holds_alternative<Event>(event)) {
      ++total;
    }
  }
  return total;
}

/// Installs a RecordingObserver for the lifetime of the guard.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;

  [[nodiscard]] const RecordingObserver::State &state() const { return *state_; }

private:
  std::shared_ptr<RecordingObserver::State> state_;
};

} // namespace snapseek::testing
