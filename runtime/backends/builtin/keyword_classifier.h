#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace modelgate {

// Zero-shot style classifier over caller-supplied categories. A category's
// raw score is the mean, over the words of its label and of any configured
// keywords, of the best match against the text: 1.0 for an exact word, else
// the character-trigram Jaccard similarity with the closest text word.
//
// Single-label scores are a softmax over raw scores (they sum to 1);
// multi-label scores are the raw scores clamped to [0, 1].
//
// spec.path may name a "category<TAB>kw1,kw2,..." keyword file.
class KeywordClassifier : public BuiltinBackend {
public:
  std::string Name() const override { return "keyword_classifier"; }

  std::vector<std::pair<std::string, double>>
  Classify(const std::string &text, const std::vector<std::string> &categories,
           bool multi_label) const;

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  void ReleaseResources() override { keywords_.clear(); }
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override {
    return {"classify"};
  }

private:
  double RawScore(const std::vector<std::string> &text_words,
                  const std::string &category) const;

  std::map<std::string, std::vector<std::string>> keywords_;
};

} // namespace modelgate
