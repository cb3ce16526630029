#include "runtime/backends/backend_factory.h"

#include "runtime/backends/builtin/dictionary_translator.h"
#include "runtime/backends/builtin/extractive_summarizer.h"
#include "runtime/backends/builtin/hashing_embedder.h"
#include "runtime/backends/builtin/keyword_classifier.h"
#include "runtime/backends/builtin/lexicon_sentiment.h"
#include "runtime/backends/builtin/pattern_ner.h"
#include "runtime/backends/remote/http_backend.h"
#include "server/logging/logger.h"

#include <algorithm>

namespace modelgate {

namespace {

const std::vector<std::string> &AllKinds() {
  static const std::vector<std::string> kKinds = {
      "llm", "speech", "embedding", "ocr", "sentiment",
      "classifier", "ner", "summarizer", "translator"};
  return kKinds;
}

std::unique_ptr<InferenceBackend> CreateBuiltin(const std::string &kind) {
  if (kind == "embedding")
    return std::make_unique<HashingEmbedder>();
  if (kind == "sentiment")
    return std::make_unique<LexiconSentiment>();
  if (kind == "classifier")
    return std::make_unique<KeywordClassifier>();
  if (kind == "ner")
    return std::make_unique<PatternNer>();
  if (kind == "summarizer")
    return std::make_unique<ExtractiveSummarizer>();
  if (kind == "translator")
    return std::make_unique<DictionaryTranslator>();
  return nullptr;
}

} // namespace

std::unique_ptr<InferenceBackend> BackendFactory::Create(const ModelSpec &spec) {
  if (!KnownKind(spec.kind)) {
    log::Error("backend_factory", "unknown model kind", "model=" + spec.id + " kind=" + spec.kind);
    return nullptr;
  }
  if (spec.provider == "http") {
    return std::make_unique<HttpBackend>();
  }
  if (spec.provider == "builtin") {
    auto backend = CreateBuiltin(spec.kind);
    if (!backend) {
      log::Error("backend_factory", "no built-in backend for kind; use provider: http",
                 "model=" + spec.id + " kind=" + spec.kind);
    }
    return backend;
  }
  log::Error("backend_factory", "unknown provider",
             "model=" + spec.id + " provider=" + spec.provider);
  return nullptr;
}

bool BackendFactory::KnownKind(const std::string &kind) {
  const auto &kinds = AllKinds();
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

bool BackendFactory::KnownProvider(const std::string &provider) {
  return provider == "builtin" || provider == "http";
}

std::vector<std::string> BackendFactory::BuiltinKinds() {
  return {"embedding", "sentiment", "classifier", "ner", "summarizer",
          "translator"};
}

} // namespace modelgate
