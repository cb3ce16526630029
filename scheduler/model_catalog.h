#pragma once

#include "runtime/backends/inference_backend.h"
#include "server/errors/gateway_error.h"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

// ── ModelCatalog ────────────────────────────────────────────────────────────
// The set of models the gateway may load, plus task -> model routing.
//
// Tasks map to model kinds:
//   chat, completion -> llm          transcribe -> speech
//   embed            -> embedding    ocr        -> ocr
//   classify         -> classifier   sentiment  -> sentiment
//   entities         -> ner          summarize  -> summarizer
//   translate        -> translator
//
// Built once at startup and read-only afterwards, so lookups take no lock.
class ModelCatalog {
public:
  // Kind serving `task`, or empty for an unknown task.
  static std::string KindForTask(const std::string &task);
  static std::vector<std::string> Tasks();

  // Estimated resident size: memory_mb, else the size of `path` rounded up
  // to whole MB (minimum 1), else 0.
  static int64_t FootprintMb(const ModelSpec &spec);

  void Add(ModelSpec spec);
  void SetRoute(const std::string &task, const std::string &model_id);

  const ModelSpec *Find(const std::string &id) const;
  const std::vector<ModelSpec> &Specs() const { return specs_; }
  const std::map<std::string, std::string> &Routes() const { return routes_; }
  bool Empty() const { return specs_.empty(); }

  // Chooses the model for a task. A non-empty `requested` model overrides
  // the configured route but must exist and be of the task's kind.
  GatewayError ResolveModel(const std::string &task,
                            const std::string &requested,
                            std::string *model_id) const;

  // Fatal configuration problems; empty when the catalog is usable under a
  // memory budget of budget_mb (0 = unlimited).
  std::vector<std::string> Validate(int64_t budget_mb) const;

private:
  std::vector<ModelSpec> specs_;
  std::unordered_map<std::string, std::size_t> index_;
  std::map<std::string, std::string> routes_; // task -> model id
};

} // namespace modelgate
