#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "snapseek/models/caption_local.hpp"
#include "snapseek/models/caption_ollama.hpp"
#include "snapseek/models/caption_openai.hpp"
#include "snapseek/models/embedder_local.hpp"
#include "snapseek/models/embedder_ollama.hpp"
#include "snapseek/models/embedder_openai.hpp"
#include "snapseek/models/image.hpp"
#include "snapseek/models/model_service.hpp"
#include "snapseek/ranking/similarity_ranker.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <cmath>
#include <thread>

namespace {

namespace md = snapseek::models;
namespace st = snapseek::testing;
using snapseek::common::ErrorKind;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

double l2_norm(const std::vector<float> &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

std::string checkerboard_png(const int size, const int cell) {
  cv::Mat image(size, size, CV_8UC3, cv::Scalar(0, 0, 0));
  for (int y = 0; y < size; ++y) {
    for (int x = 0; x < size; ++x) {
      if (((x / cell) + (y / cell)) % 2 == 0) {
        image.at<cv::Vec3b>(y, x) = cv::Vec3b(255, 255, 255);
      }
    }
  }
  std::vector<unsigned char> out;
  cv::imencode(".png", image, out);
  return std::string(out.begin(), out.end());
}

md::HttpResponse ok_response(std::string body) {
  md::HttpResponse response;
  response.status = 200;
  response.body = std::move(body);
  return response;
}

/// Tracks how many callers are inside caption() at once.
class OverlapCaptionEngine final : public md::ICaptionEngine {
public:
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};

  [[nodiscard]] std::string_view name() const override { return "overlap"; }
  [[nodiscard]] snapseek::common::Result<std::string> caption(std::string_view) override {
    const int now = ++active;
    int seen = max_active.load();
    while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    --active;
    return snapseek::common::Result<std::string>::success("busy");
  }
};

} // namespace

void register_models_tests(std::vector<snapseek::tests::TestCase> &tests) {
  using snapseek::tests::require;

  tests.push_back({"fnv1a_64_known_values", [] {
                     require(md::fnv1a_64("") == 14695981039346656037ULL, "offset basis");
                     require(md::fnv1a_64("a") == 0xaf63dc4c8601ec8cULL, "hash of 'a'");
                   }});

  tests.push_back({"tokenize_words_lowercases_and_splits", [] {
                     const auto words = md::tokenize_words("A Red-Car, 2 cats!");
                     require(words.size() == 5, "expected five tokens");
                     require(words[0] == "a" && words[1] == "red" && words[2] == "car" &&
                                 words[3] == "2" && words[4] == "cats",
                             "unexpected tokens");
                     require(md::tokenize_words("  ...  ").empty(), "punctuation has no tokens");
                   }});

  tests.push_back({"local_embedder_is_deterministic_and_normalized", [] {
                     md::LocalEmbedder first(64);
                     md::LocalEmbedder second(64);
                     const auto a = first.embed("a red square image");
                     const auto b = second.embed("a red square image");
                     require(a.ok() && b.ok(), "embedding failed");
                     require(a.value().size() == 64, "wrong dimension count");
                     require(a.value() == b.value(), "embedding is not deterministic");
                     require(std::abs(l2_norm(a.value()) - 1.0) < 1e-5, "vector is not unit length");
                   }});

  tests.push_back({"local_embedder_empty_text_is_zero_vector", [] {
                     md::LocalEmbedder embedder(32);
                     const auto v = embedder.embed("!!!");
                     require(v.ok(), v.error());
                     require(v.value().size() == 32, "wrong dimension count");
                     require(std::all_of(v.value().begin(), v.value().end(),
                                         [](const float x) { return x == 0.0F; }),
                             "expected zero vector");
                   }});

  tests.push_back({"local_embedder_shared_words_score_higher", [] {
                     md::LocalEmbedder embedder(384);
                     const auto query = embedder.embed("blue").value();
                     const auto blue = embedder.embed("a blue square image").value();
                     const auto red = embedder.embed("a red square image").value();
                     require(snapseek::ranking::cosine_similarity(query, blue) >
                                 snapseek::ranking::cosine_similarity(query, red),
                             "query should be closer to the caption sharing its word");
                   }});

  tests.push_back({"base64_encode_matches_reference", [] {
                     require(md::base64_encode("hello") == "aGVsbG8=", "hello");
                     require(md::base64_encode("") == "", "empty");
                     require(md::base64_encode("ab") == "YWI=", "ab");
                   }});

  tests.push_back({"decode_image_coerces_grayscale", [] {
                     const auto image = md::decode_image(st::gray_png(10, 6, 128));
                     require(image.ok(), image.error());
                     require(image.value().channels() == 3, "expected three channels");
                     require(image.value().cols == 10 && image.value().rows == 6, "size changed");
                   }});

  tests.push_back({"decode_image_rejects_garbage", [] {
                     const auto empty = md::decode_image("");
                     require(!empty.ok() && empty.kind() == ErrorKind::InvalidImage, "empty");
                     const auto junk = md::decode_image("this is not an image at all");
                     require(!junk.ok() && junk.kind() == ErrorKind::InvalidImage, "junk");
                   }});

  tests.push_back({"nearest_color_name_picks_palette_entry", [] {
                     require(md::nearest_color_name(250, 5, 5) == "red", "red");
                     require(md::nearest_color_name(10, 10, 240) == "blue", "blue");
                     require(md::nearest_color_name(5, 5, 5) == "black", "black");
                     require(md::nearest_color_name(250, 250, 250) == "white", "white");
                   }});

  tests.push_back({"local_caption_describes_solid_colors", [] {
                     md::LocalCaptionEngine engine;
                     const auto red = engine.caption(st::solid_image(100, 100, 255, 0, 0, "png"));
                     require(red.ok(), red.error());
                     require(red.value() == "a red square image", "got: " + red.value());

                     const auto blue = engine.caption(st::solid_image(100, 100, 0, 0, 255, "png"));
                     require(blue.ok(), blue.error());
                     require(blue.value() == "a blue square image", "got: " + blue.value());

                     const auto wide = engine.caption(st::solid_image(200, 80, 0, 160, 0, "png"));
                     require(wide.ok(), wide.error());
                     require(wide.value() == "a green wide image", "got: " + wide.value());

                     const auto tall = engine.caption(st::solid_image(40, 120, 255, 255, 255, "png"));
                     require(tall.ok(), tall.error());
                     require(tall.value() == "a white tall image", "got: " + tall.value());
                   }});

  tests.push_back({"local_caption_handles_grayscale_and_texture", [] {
                     md::LocalCaptionEngine engine;
                     const auto gray = engine.caption(st::gray_png(50, 50, 128));
                     require(gray.ok(), gray.error());
                     require(gray.value() == "a gray square image", "got: " + gray.value());

                     const auto board = engine.caption(checkerboard_png(64, 8));
                     require(board.ok(), board.error());
                     require(board.value() == "a textured square image, mostly gray",
                             "got: " + board.value());
                   }});

  tests.push_back({"local_caption_rejects_invalid_bytes", [] {
                     md::LocalCaptionEngine engine;
                     const auto caption = engine.caption("not an image");
                     require(!caption.ok(), "garbage should fail");
                     require(caption.kind() == ErrorKind::ModelFailure, "expected model failure");
                   }});

  tests.push_back({"ollama_caption_posts_generate_request", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     http->next_post = ok_response(R"({"model":"llava","response":"  a cat  "})");
                     snapseek::config::CaptionConfig config;
                     md::OllamaCaptionEngine engine(config, http);

                     const auto caption =
                         engine.caption(st::solid_image(16, 16, 200, 200, 200, "png"));
                     require(caption.ok(), caption.error());
                     require(caption.value() == "a cat", "caption should be trimmed");
                     require(http->post_calls == 1, "expected one request");
                     require(http->last_url == "http://localhost:11434/api/generate",
                             "unexpected url: " + http->last_url);
                     require(contains(http->last_body, "\"model\":\"llava\""), "model missing");
                     require(contains(http->last_body, "\"stream\":false"), "stream flag missing");
                     require(contains(http->last_body, "\"images\":[\""), "image missing");
                   }});

  tests.push_back({"ollama_caption_maps_http_errors", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     http->next_post.status = 404;
                     http->next_post.body = R"({"error":"model 'llava' not found"})";
                     snapseek::config::CaptionConfig config;
                     config.base_url = "http://gpu-box:11434/";
                     md::OllamaCaptionEngine engine(config, http);

                     const auto caption =
                         engine.caption(st::solid_image(16, 16, 10, 20, 30, "png"));
                     require(!caption.ok(), "404 should fail");
                     require(caption.kind() == ErrorKind::ModelFailure, "expected model failure");
                     require(contains(caption.error(), "HTTP 404"), caption.error());
                     require(contains(caption.error(), "not found"), caption.error());
                     require(http->last_url == "http://gpu-box:11434/api/generate",
                             "trailing slash should be trimmed");

                     http->next_post = md::HttpResponse{};
                     http->next_post.network_error = true;
                     http->next_post.network_error_message = "Couldn't connect to server";
                     const auto offline =
                         engine.caption(st::solid_image(16, 16, 10, 20, 30, "png"));
                     require(offline.kind() == ErrorKind::ModelFailure, "network error");

                     http->next_post = ok_response(R"({"response":"   "})");
                     const auto blank = engine.caption(st::solid_image(16, 16, 10, 20, 30, "png"));
                     require(blank.kind() == ErrorKind::ModelFailure, "blank caption");
                   }});

  tests.push_back({"remote_caption_skips_request_for_invalid_image", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     http->next_post = ok_response(R"({"response":"never"})");
                     md::OllamaCaptionEngine engine(snapseek::config::CaptionConfig{}, http);
                     const auto caption = engine.caption("definitely not pixels");
                     require(caption.kind() == ErrorKind::ModelFailure, "expected model failure");
                     require(http->post_calls == 0, "no request should be sent");
                   }});

  tests.push_back({"openai_caption_requires_key", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     md::OpenAiCaptionEngine engine(snapseek::config::CaptionConfig{}, "", http);
                     const auto caption =
                         engine.caption(st::solid_image(16, 16, 10, 20, 30, "png"));
                     require(caption.kind() == ErrorKind::ModelFailure, "missing key");
                     require(contains(caption.error(), "API key"), caption.error());
                     require(http->post_calls == 0, "no request without a key");
                   }});

  tests.push_back({"openai_caption_parses_chat_completion", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     http->next_post = ok_response(
                         R"({"id":"x","choices":[{"index":0,"message":{"role":"assistant","content":"a dog on grass"}}]})");
                     snapseek::config::CaptionConfig config;
                     config.model = "gpt-4o-mini";
                     md::OpenAiCaptionEngine engine(config, "sk-test", http);

                     const auto caption =
                         engine.caption(st::solid_image(16, 16, 10, 200, 30, "png"));
                     require(caption.ok(), caption.error());
                     require(caption.value() == "a dog on grass", "got: " + caption.value());
                     require(http->last_url == "https://api.openai.com/v1/chat/completions",
                             "unexpected url: " + http->last_url);
                     require(http->last_headers["Authorization"] == "Bearer sk-test",
                             "missing bearer token");
                     require(contains(http->last_body, "data:image/jpeg;base64,"),
                             "image should be a data uri");
                     require(contains(http->last_body, "\"max_tokens\":100"), "token cap");
                   }});

  tests.push_back({"parse_chat_completion_content_rejects_empty", [] {
                     require(md::parse_chat_completion_content(R"({"choices":[]})").kind() ==
                                 ErrorKind::ModelFailure,
                             "no choices");
                     require(md::parse_chat_completion_content(
                                 R"({"choices":[{"message":{"content":""}}]})")
                                     .kind() == ErrorKind::ModelFailure,
                             "empty content");
                   }});

  tests.push_back({"ollama_embedder_checks_length", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     snapseek::config::EmbeddingConfig config;
                     config.dimensions = 3;
                     md::OllamaEmbedder embedder(config, http);

                     http->next_post = ok_response(R"({"embedding":[0.1, -0.2, 0.3]})");
                     const auto ok = embedder.embed("a red car");
                     require(ok.ok(), ok.error());
                     require(ok.value().size() == 3, "wrong size");
                     require(std::abs(ok.value()[1] + 0.2F) < 1e-6F, "wrong value");
                     require(http->last_url == "http://localhost:11434/api/embeddings",
                             "unexpected url: " + http->last_url);
                     require(contains(http->last_body, "\"prompt\":\"a red car\""), "prompt");

                     http->next_post = ok_response(R"({"embedding":[0.1, 0.2]})");
                     const auto short_vec = embedder.embed("a red car");
                     require(short_vec.kind() == ErrorKind::ModelFailure, "short vector");
                     require(contains(short_vec.error(), "2 dimensions"), short_vec.error());

                     http->next_post = ok_response(R"({"other":1})");
                     require(embedder.embed("x").kind() == ErrorKind::ModelFailure,
                             "missing field");
                   }});

  tests.push_back({"openai_embedder_reads_first_data_item", [] {
                     auto http = std::make_shared<st::MockHttpClient>();
                     snapseek::config::EmbeddingConfig config;
                     config.dimensions = 2;
                     config.base_url = "http://proxy.local/v1";
                     md::OpenAiEmbedder embedder(config, "sk-test", http);

                     http->next_post = ok_response(
                         R"({"object":"list","data":[{"object":"embedding","index":0,"embedding":[1.0,0.5]}]})");
                     const auto vec = embedder.embed("query");
                     require(vec.ok(), vec.error());
                     require(vec.value().size() == 2 && vec.value()[1] == 0.5F, "wrong vector");
                     require(http->last_url == "http://proxy.local/v1/embeddings",
                             "unexpected url: " + http->last_url);
                     require(contains(http->last_body, "\"input\":\"query\""), "input");

                     md::OpenAiEmbedder keyless(config, "", http);
                     require(keyless.embed("query").kind() == ErrorKind::ModelFailure,
                             "missing key");
                   }});

  tests.push_back({"factories_normalize_and_reject_providers", [] {
                     snapseek::config::Config config;
                     config.caption.provider = "  Local ";
                     config.embedding.provider = "LOCAL";
                     config.embedding.dimensions = 16;
                     const auto service = md::ModelService::create(config);
                     require(service.ok(), service.error());
                     require(service.value()->describe() ==
                                 "caption=local embedding=local dimensions=16",
                             service.value()->describe());

                     config.caption.provider = "mystery";
                     const auto bad_caption = md::ModelService::create(config);
                     require(bad_caption.kind() == ErrorKind::Configuration, "unknown caption");

                     config.caption.provider = "local";
                     config.embedding.provider = "word2vec";
                     const auto bad_embed = md::ModelService::create(config);
                     require(bad_embed.kind() == ErrorKind::Configuration, "unknown embedder");

                     config.embedding.provider = "local";
                     config.embedding.dimensions = 0;
                     require(md::ModelService::create(config).kind() == ErrorKind::Configuration,
                             "zero dimensions");
                   }});

  tests.push_back({"model_service_rejects_bad_outputs", [] {
                     auto caption = std::make_unique<st::FakeCaptionEngine>("");
                     auto embedder = std::make_unique<st::ScriptedEmbedder>(4);
                     embedder->script("short", {1.0F, 0.0F});
                     embedder->script("nan", {1.0F, std::nanf(""), 0.0F, 0.0F});
                     md::ModelService service(std::move(caption), std::move(embedder));

                     const auto empty = service.caption("bytes");
                     require(empty.kind() == ErrorKind::ModelFailure, "empty caption");
                     const auto short_vec = service.embed("short");
                     require(short_vec.kind() == ErrorKind::ModelFailure, "short vector");
                     require(contains(short_vec.error(), "expected 4"), short_vec.error());
                     require(service.embed("nan").kind() == ErrorKind::ModelFailure, "nan");
                     require(service.embed("anything else").ok(), "fallback vector");
                   }});

  tests.push_back({"model_service_records_inference_latency", [] {
                     st::ObserverGuard guard;
                     md::ModelService service(std::make_unique<st::FakeCaptionEngine>(),
                                              std::make_unique<st::ScriptedEmbedder>(8));
                     require(service.caption("bytes").ok(), "caption");
                     require(service.embed("text").ok(), "embed");

                     std::size_t caption_metrics = 0;
                     std::size_t embed_metrics = 0;
                     for (const auto &metric : guard.state().metrics) {
                       if (const auto *latency =
                               std::get_if<snapseek::observability::InferenceLatencyMetric>(
                                   &metric)) {
                         caption_metrics += latency->operation == "caption" ? 1 : 0;
                         embed_metrics += latency->operation == "embed" ? 1 : 0;
                       }
                     }
                     require(caption_metrics == 1 && embed_metrics == 1,
                             "expected one latency sample per call");
                   }});

  tests.push_back({"model_service_serializes_single_slot_backends", [] {
                     auto engine = std::make_unique<OverlapCaptionEngine>();
                     auto *probe = engine.get();
                     md::ModelService service(std::move(engine),
                                              std::make_unique<st::ScriptedEmbedder>(4));
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 4; ++i) {
                       workers.emplace_back([&service] {
                         for (int j = 0; j < 3; ++j) {
                           (void)service.caption("bytes");
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(probe->max_active.load() == 1,
                             "caption backend entered concurrently");
                   }});

  tests.push_back({"model_service_requires_both_backends", [] {
                     bool threw = false;
                     try {
                       md::ModelService service(nullptr, std::make_unique<st::ScriptedEmbedder>(4));
                     } catch (const std::invalid_argument &) {
                       threw = true;
                     }
                     require(threw, "null caption engine should throw");
                   }});
}
