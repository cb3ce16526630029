#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct SentimentScore {
  double compound{0.0}; // [-1, 1]
  std::string label;    // very_negative .. very_positive
  std::string intensity; // low, medium, high
  std::vector<std::string> matched;
};

// Lexicon scorer for Spanish and English text. Word scores run from -3 to +3;
// a negator ("not", "no", "nunca") flips the next two scored words and an
// intensifier ("very", "muy") scales the next one by 1.5. The summed score is
// squashed to [-1, 1] as s / sqrt(s^2 + 15).
//
// With spec.path set, the lexicon is read from "word<TAB>score" lines instead
// of the built-in one.
class LexiconSentiment : public BuiltinBackend {
public:
  std::string Name() const override { return "lexicon_sentiment"; }

  SentimentScore Score(const std::string &text) const;
  static std::string LabelFor(double compound);

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  void ReleaseResources() override { lexicon_.clear(); }
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override {
    return {"sentiment"};
  }
  nlohmann::json Describe() const override;

private:
  std::unordered_map<std::string, double> lexicon_;
};

} // namespace modelgate
