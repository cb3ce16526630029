#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace modelgate {

// ── Model description ───────────────────────────────────────────────────────
// One entry of the models.catalog section. `id` is "<kind>:<name>", e.g.
// "embedding:minilm" or "llm:mistral-7b".
struct ModelSpec {
  std::string id;
  std::string kind;              // llm, speech, embedding, ocr, sentiment, ...
  std::string provider{"builtin"}; // builtin or http
  std::string path;              // weights / lexicon / dictionary file
  std::string endpoint;          // base URL for provider=http
  int64_t memory_mb{0};          // 0 = derive from file size
  int max_concurrency{0};        // 0 = models.default_max_concurrency
  int max_queue{-1};             // -1 = models.default_max_queue, 0 = unbounded
  bool pinned{false};
  bool preload{false};
  std::map<std::string, std::string> options;

  std::string Option(const std::string &key,
                     const std::string &fallback = {}) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
  }
};

// ── InferenceBackend ────────────────────────────────────────────────────────
// The gateway's only view of an inference engine. Instances are created
// unloaded by BackendFactory and owned by exactly one model slot.
//
// Threading: Load/Unload are never called concurrently with each other or with
// Invoke (the slot state machine guarantees it). Invoke may be called from up
// to max_concurrency threads at once.
class InferenceBackend {
public:
  virtual ~InferenceBackend() = default;

  // Returns false and fills *error on failure; may also throw.
  virtual bool Load(const ModelSpec &spec, std::string *error) = 0;
  virtual void Unload() = 0;
  virtual bool IsReady() const = 0;

  // Throws std::invalid_argument for malformed input, any other exception for
  // engine failures.
  virtual nlohmann::json Invoke(const std::string &operation,
                                const nlohmann::json &input) = 0;

  virtual std::vector<std::string> Operations() const = 0;
  virtual std::string Name() const = 0;
};

} // namespace modelgate
