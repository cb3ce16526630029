#include "runtime/backends/builtin/hashing_embedder.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <cmath>
#include <stdexcept>

namespace modelgate {

namespace {
constexpr float kWordWeight = 1.0f;
constexpr float kBigramWeight = 0.5f;
constexpr float kTrigramWeight = 0.25f;

bool ParsePositive(const std::string &text, int *out) {
  try {
    std::size_t used = 0;
    int value = std::stoi(text, &used);
    if (used != text.size() || value <= 0)
      return false;
    *out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}
} // namespace

bool HashingEmbedder::LoadResources(const ModelSpec &spec, std::string *error) {
  auto dims = spec.Option("dimensions");
  if (!dims.empty() && !ParsePositive(dims, &dimensions_)) {
    if (error)
      *error = "invalid dimensions option: " + dims;
    return false;
  }
  auto max_texts = spec.Option("max_texts");
  if (!max_texts.empty() && !ParsePositive(max_texts, &max_texts_)) {
    if (error)
      *error = "invalid max_texts option: " + max_texts;
    return false;
  }
  return true;
}

void HashingEmbedder::AddFeature(const std::string &feature, float weight,
                                 std::vector<float> *vec) const {
  auto hash = text::Fnv1a(feature);
  auto index = static_cast<std::size_t>(hash % static_cast<uint64_t>(dimensions_));
  float sign = (hash >> 63) ? -1.0f : 1.0f;
  (*vec)[index] += sign * weight;
}

std::vector<float> HashingEmbedder::Embed(const std::string &input,
                                          bool normalize) const {
  std::vector<float> vec(static_cast<std::size_t>(dimensions_), 0.0f);
  auto words = text::Words(input);
  for (std::size_t i = 0; i < words.size(); ++i) {
    const auto &word = words[i];
    AddFeature("w:" + word, kWordWeight, &vec);
    if (i + 1 < words.size()) {
      AddFeature("b:" + word + " " + words[i + 1], kBigramWeight, &vec);
    }
    std::string padded = "#" + word + "#";
    for (std::size_t j = 0; j + 3 <= padded.size(); ++j) {
      AddFeature("c:" + padded.substr(j, 3), kTrigramWeight, &vec);
    }
  }
  if (normalize) {
    double norm = 0.0;
    for (float v : vec)
      norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
      for (auto &v : vec)
        v = static_cast<float>(v / norm);
    }
  }
  return vec;
}

nlohmann::json HashingEmbedder::Run(const std::string &operation,
                                    const nlohmann::json &input) {
  (void)operation;
  if (!input.is_object() || !input.contains("texts") ||
      !input.at("texts").is_array()) {
    throw std::invalid_argument("'texts' must be an array of strings");
  }
  const auto &texts = input.at("texts");
  if (texts.empty()) {
    throw std::invalid_argument("'texts' must not be empty");
  }
  if (static_cast<int>(texts.size()) > max_texts_) {
    throw std::invalid_argument("at most " + std::to_string(max_texts_) +
                                " texts per request");
  }
  bool normalize = text::OptionalBool(input, "normalize", true);

  nlohmann::json embeddings = nlohmann::json::array();
  std::size_t tokens = 0;
  for (const auto &item : texts) {
    if (!item.is_string()) {
      throw std::invalid_argument("'texts' must be an array of strings");
    }
    const auto &value = item.get_ref<const std::string &>();
    tokens += text::RawTokens(value).size();
    embeddings.push_back(Embed(value, normalize));
  }
  return {{"embeddings", std::move(embeddings)},
          {"dimensions", dimensions_},
          {"tokens_used", tokens},
          {"model", model_id()}};
}

nlohmann::json HashingEmbedder::Describe() const {
  return {{"dimensions", dimensions_},
          {"max_texts", max_texts_},
          {"normalized", true}};
}

} // namespace modelgate
