#include "runtime/backends/builtin/lexicon_sentiment.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <cctype>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace modelgate {

namespace {

const std::vector<std::pair<const char *, double>> &BuiltinLexicon() {
  static const std::vector<std::pair<const char *, double>> kLexicon = {
      // en
      {"excellent", 3}, {"amazing", 3}, {"outstanding", 3}, {"perfect", 3},
      {"love", 3}, {"great", 2}, {"good", 2}, {"happy", 2}, {"nice", 2},
      {"recommend", 2}, {"fast", 1}, {"helpful", 2}, {"satisfied", 2},
      {"fine", 1}, {"ok", 1}, {"slow", -1}, {"problem", -1}, {"issue", -1},
      {"bad", -2}, {"poor", -2}, {"broken", -2}, {"angry", -2},
      {"disappointed", -2}, {"wrong", -2}, {"refund", -1}, {"terrible", -3},
      {"awful", -3}, {"horrible", -3}, {"hate", -3}, {"worst", -3},
      {"useless", -3},
      // es
      {"excelente", 3}, {"increíble", 3}, {"perfecto", 3}, {"encanta", 3},
      {"genial", 3}, {"bueno", 2}, {"buena", 2}, {"feliz", 2}, {"contento", 2},
      {"satisfecho", 2}, {"recomiendo", 2}, {"rápido", 1}, {"útil", 2},
      {"gracias", 1}, {"lento", -1}, {"problema", -1}, {"falla", -2},
      {"malo", -2}, {"mala", -2}, {"roto", -2}, {"molesto", -2},
      {"decepcionado", -2}, {"reclamo", -1}, {"terrible", -3},
      {"horrible", -3}, {"pésimo", -3}, {"odio", -3}, {"peor", -3},
      {"inútil", -3}, {"funciona", 1}};
  return kLexicon;
}

const std::unordered_set<std::string> &Negators() {
  static const std::unordered_set<std::string> kNegators = {
      "not", "no", "never", "don't", "isn't", "wasn't", "without",
      "nunca", "jamás", "tampoco", "ni", "sin"};
  return kNegators;
}

const std::unordered_set<std::string> &Intensifiers() {
  static const std::unordered_set<std::string> kIntensifiers = {
      "very", "really", "extremely", "so", "super", "too",
      "muy", "realmente", "extremadamente", "súper", "demasiado", "tan"};
  return kIntensifiers;
}

constexpr double kNormalizer = 15.0;
constexpr double kIntensifierScale = 1.5;

} // namespace

bool LexiconSentiment::LoadResources(const ModelSpec &spec, std::string *error) {
  lexicon_.clear();
  if (spec.path.empty()) {
    for (const auto &[word, score] : BuiltinLexicon()) {
      lexicon_[word] = score;
    }
    return true;
  }
  std::vector<std::pair<std::string, std::string>> rows;
  if (!text::LoadTabSeparated(spec.path, &rows, error)) {
    return false;
  }
  for (const auto &[word, score] : rows) {
    try {
      lexicon_[text::Lowercase(word)] = std::stod(score);
    } catch (const std::exception &) {
      if (error)
        *error = "invalid lexicon score for '" + word + "'";
      return false;
    }
  }
  if (lexicon_.empty()) {
    if (error)
      *error = "lexicon file is empty: " + spec.path;
    return false;
  }
  return true;
}

std::string LexiconSentiment::LabelFor(double compound) {
  if (compound >= 0.6)
    return "very_positive";
  if (compound >= 0.15)
    return "positive";
  if (compound > -0.15)
    return "neutral";
  if (compound > -0.6)
    return "negative";
  return "very_negative";
}

SentimentScore LexiconSentiment::Score(const std::string &input) const {
  SentimentScore result;
  // Keep apostrophes so "don't" reaches the negator table.
  std::vector<std::string> words;
  for (const auto &token : text::RawTokens(input)) {
    std::string cleaned;
    for (char c : token) {
      auto uc = static_cast<unsigned char>(c);
      if (std::isalnum(uc) || uc >= 0x80 || c == '\'')
        cleaned.push_back(c);
    }
    if (!cleaned.empty())
      words.push_back(text::Lowercase(cleaned));
  }

  double sum = 0.0;
  int negate_left = 0;
  double scale = 1.0;
  for (const auto &word : words) {
    if (Negators().count(word)) {
      negate_left = 2;
      continue;
    }
    if (Intensifiers().count(word)) {
      scale = kIntensifierScale;
      continue;
    }
    auto it = lexicon_.find(word);
    if (it == lexicon_.end()) {
      if (negate_left > 0)
        --negate_left;
      continue;
    }
    double value = it->second * scale;
    if (negate_left > 0) {
      value = -value;
      negate_left = 0;
    }
    scale = 1.0;
    sum += value;
    result.matched.push_back(word);
  }

  result.compound = sum == 0.0 ? 0.0 : sum / std::sqrt(sum * sum + kNormalizer);
  result.label = LabelFor(result.compound);
  if (result.label.rfind("very_", 0) == 0) {
    result.intensity = "high";
  } else if (result.label == "neutral") {
    result.intensity = "low";
  } else {
    result.intensity = "medium";
  }
  return result;
}

nlohmann::json LexiconSentiment::Run(const std::string &operation,
                                     const nlohmann::json &input) {
  (void)operation;
  auto body = text::RequireText(input, "text");
  auto score = Score(body);
  double confidence = score.label == "neutral" ? 1.0 - std::fabs(score.compound)
                                               : std::fabs(score.compound);
  return {{"sentiment", score.label},
          {"score", std::round(score.compound * 10000.0) / 10000.0},
          {"confidence", std::round(confidence * 10000.0) / 10000.0},
          {"intensity", score.intensity},
          {"matched_terms", score.matched}};
}

nlohmann::json LexiconSentiment::Describe() const {
  return {{"lexicon_size", lexicon_.size()},
          {"labels",
           {"very_negative", "negative", "neutral", "positive",
            "very_positive"}}};
}

} // namespace modelgate
