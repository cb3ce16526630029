#include "runtime/backends/builtin/extractive_summarizer.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace modelgate {

namespace {

constexpr int kDefaultMaxLength = 150;

// Cuts at the last space that keeps the text within `limit` bytes and never
// splits a UTF-8 sequence.
std::string Truncate(const std::string &s, std::size_t limit) {
  if (s.size() <= limit)
    return s;
  std::size_t cut = limit >= 3 ? limit - 3 : 0;
  auto space = s.rfind(' ', cut);
  if (space != std::string::npos && space > 0) {
    cut = space;
  } else {
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
      --cut;
  }
  return s.substr(0, cut) + "...";
}

} // namespace

bool ExtractiveSummarizer::LoadResources(const ModelSpec &spec,
                                         std::string *error) {
  (void)spec;
  (void)error;
  return true;
}

Summary ExtractiveSummarizer::Summarize(const std::string &input,
                                        std::size_t max_length) const {
  Summary out;
  auto sentences = text::SplitSentences(input);
  out.sentences_total = sentences.size();
  if (sentences.empty())
    return out;

  std::unordered_map<std::string, double> freq;
  std::vector<std::vector<std::string>> sentence_words;
  for (const auto &sentence : sentences) {
    std::vector<std::string> content;
    for (auto &w : text::Words(sentence)) {
      if (!text::IsStopword(w)) {
        freq[w] += 1.0;
        content.push_back(std::move(w));
      }
    }
    sentence_words.push_back(std::move(content));
  }

  std::vector<std::pair<double, std::size_t>> ranked;
  for (std::size_t i = 0; i < sentences.size(); ++i) {
    double score = 0.0;
    for (const auto &w : sentence_words[i])
      score += freq[w];
    if (!sentence_words[i].empty())
      score /= static_cast<double>(sentence_words[i].size());
    // Ties go to the earlier sentence.
    ranked.emplace_back(score, i);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &a, const auto &b) { return a.first > b.first; });

  std::vector<std::size_t> chosen;
  std::size_t length = 0;
  for (const auto &[score, index] : ranked) {
    std::size_t add = sentences[index].size() + (chosen.empty() ? 0 : 1);
    if (length + add > max_length)
      continue;
    chosen.push_back(index);
    length += add;
  }
  if (chosen.empty()) {
    out.text = Truncate(sentences[ranked.front().second], max_length);
    out.sentences_selected = 1;
    return out;
  }
  std::sort(chosen.begin(), chosen.end());
  for (auto index : chosen) {
    if (!out.text.empty())
      out.text.push_back(' ');
    out.text += sentences[index];
  }
  out.sentences_selected = chosen.size();
  return out;
}

nlohmann::json ExtractiveSummarizer::Run(const std::string &operation,
                                         const nlohmann::json &input) {
  (void)operation;
  auto body = text::RequireText(input, "text");
  int max_length = text::OptionalInt(input, "max_length", kDefaultMaxLength);
  if (max_length <= 0) {
    throw std::invalid_argument("'max_length' must be positive");
  }
  auto summary = Summarize(body, static_cast<std::size_t>(max_length));
  return {{"summary", summary.text},
          {"sentences_selected", summary.sentences_selected},
          {"sentences_total", summary.sentences_total}};
}

} // namespace modelgate
