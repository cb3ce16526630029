#include "runtime/backends/builtin/keyword_classifier.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace modelgate {

namespace {

constexpr double kSoftmaxTemperature = 5.0;

std::set<std::string> Trigrams(const std::string &word) {
  std::set<std::string> grams;
  std::string padded = "#" + word + "#";
  for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
    grams.insert(padded.substr(i, 3));
  }
  return grams;
}

double Jaccard(const std::set<std::string> &a, const std::set<std::string> &b) {
  if (a.empty() || b.empty())
    return 0.0;
  std::size_t shared = 0;
  for (const auto &g : a) {
    shared += b.count(g);
  }
  return static_cast<double>(shared) /
         static_cast<double>(a.size() + b.size() - shared);
}

std::vector<std::string> LabelWords(const std::string &label) {
  std::string spaced = label;
  std::replace(spaced.begin(), spaced.end(), '_', ' ');
  std::replace(spaced.begin(), spaced.end(), '-', ' ');
  return text::Words(spaced);
}

double Round4(double v) { return std::round(v * 10000.0) / 10000.0; }

} // namespace

bool KeywordClassifier::LoadResources(const ModelSpec &spec,
                                      std::string *error) {
  keywords_.clear();
  if (spec.path.empty())
    return true;
  std::vector<std::pair<std::string, std::string>> rows;
  if (!text::LoadTabSeparated(spec.path, &rows, error))
    return false;
  for (const auto &[category, list] : rows) {
    auto &bucket = keywords_[text::Lowercase(category)];
    for (auto &word : text::Words(list)) {
      bucket.push_back(std::move(word));
    }
  }
  return true;
}

double KeywordClassifier::RawScore(const std::vector<std::string> &text_words,
                                   const std::string &category) const {
  auto cues = LabelWords(category);
  auto it = keywords_.find(text::Lowercase(category));
  if (it != keywords_.end()) {
    cues.insert(cues.end(), it->second.begin(), it->second.end());
  }
  if (cues.empty() || text_words.empty())
    return 0.0;

  double total = 0.0;
  double best_overall = 0.0;
  for (const auto &cue : cues) {
    double best = 0.0;
    auto cue_grams = Trigrams(cue);
    for (const auto &word : text_words) {
      if (word == cue) {
        best = 1.0;
        break;
      }
      best = std::max(best, Jaccard(cue_grams, Trigrams(word)));
    }
    total += best;
    best_overall = std::max(best_overall, best);
  }
  // One strong keyword hit should count even when the label has many words.
  return std::max(total / static_cast<double>(cues.size()), best_overall * 0.75);
}

std::vector<std::pair<std::string, double>>
KeywordClassifier::Classify(const std::string &input,
                            const std::vector<std::string> &categories,
                            bool multi_label) const {
  std::vector<std::string> words;
  for (auto &w : text::Words(input)) {
    if (!text::IsStopword(w))
      words.push_back(std::move(w));
  }

  std::vector<std::pair<std::string, double>> scored;
  for (const auto &category : categories) {
    scored.emplace_back(category, RawScore(words, category));
  }
  if (multi_label) {
    for (auto &entry : scored) {
      entry.second = std::min(1.0, std::max(0.0, entry.second));
    }
  } else {
    double denom = 0.0;
    for (const auto &entry : scored) {
      denom += std::exp(entry.second * kSoftmaxTemperature);
    }
    for (auto &entry : scored) {
      entry.second = std::exp(entry.second * kSoftmaxTemperature) / denom;
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  return scored;
}

nlohmann::json KeywordClassifier::Run(const std::string &operation,
                                      const nlohmann::json &input) {
  (void)operation;
  auto body = text::RequireText(input, "text");
  if (!input.contains("categories") || !input.at("categories").is_array() ||
      input.at("categories").empty()) {
    throw std::invalid_argument("at least one category is required");
  }
  std::vector<std::string> categories;
  for (const auto &item : input.at("categories")) {
    if (!item.is_string() || item.get_ref<const std::string &>().empty()) {
      throw std::invalid_argument("categories must be non-empty strings");
    }
    categories.push_back(item.get<std::string>());
  }
  bool multi_label = text::OptionalBool(input, "multi_label", false);

  auto ranked = Classify(body, categories, multi_label);
  nlohmann::json labels = nlohmann::json::array();
  nlohmann::json scores = nlohmann::json::array();
  for (const auto &[label, score] : ranked) {
    labels.push_back(label);
    scores.push_back(Round4(score));
  }
  return {{"labels", labels},
          {"scores", scores},
          {"top_category", ranked.front().first},
          {"confidence", Round4(ranked.front().second)},
          {"multi_label", multi_label}};
}

} // namespace modelgate
