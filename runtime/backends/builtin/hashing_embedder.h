#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <string>
#include <vector>

namespace modelgate {

// Sentence embeddings by feature hashing: every word, word bigram and
// character trigram is hashed into one of `dimensions` buckets with a signed
// weight. Deterministic, so equal texts always map to equal vectors.
//
// Options: dimensions (default 384), max_texts (default 100).
class HashingEmbedder : public BuiltinBackend {
public:
  static constexpr int kDefaultDimensions = 384;

  std::string Name() const override { return "hashing_embedder"; }

  std::vector<float> Embed(const std::string &text, bool normalize) const;
  int dimensions() const { return dimensions_; }

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override { return {"embed"}; }
  nlohmann::json Describe() const override;

private:
  void AddFeature(const std::string &feature, float weight,
                  std::vector<float> *vec) const;

  int dimensions_{kDefaultDimensions};
  int max_texts_{100};
};

} // namespace modelgate
