#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <string>
#include <vector>

namespace modelgate {

struct Summary {
  std::string text;
  std::size_t sentences_selected{0};
  std::size_t sentences_total{0};
};

// Frequency-scored extractive summarizer. Sentences are ranked by the mean
// frequency of their non-stopword words, picked greedily while the summary
// stays within max_length characters, then emitted in original order.
class ExtractiveSummarizer : public BuiltinBackend {
public:
  std::string Name() const override { return "extractive_summarizer"; }

  Summary Summarize(const std::string &text, std::size_t max_length) const;

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override {
    return {"summarize"};
  }
};

} // namespace modelgate
