#include "runtime/backends/builtin/pattern_ner.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace modelgate {

namespace {

constexpr double kPatternScore = 0.95;

const char *kMonths =
    "(?:january|february|march|april|may|june|july|august|september|october|"
    "november|december|enero|febrero|marzo|abril|mayo|junio|julio|agosto|"
    "septiembre|octubre|noviembre|diciembre)";

const std::unordered_set<std::string> &Titles() {
  static const std::unordered_set<std::string> kTitles = {
      "mr", "mrs", "ms", "dr", "prof", "sr", "sra", "srta", "señor", "señora",
      "don", "doña", "ing", "lic"};
  return kTitles;
}

const std::unordered_set<std::string> &OrgMarkers() {
  static const std::unordered_set<std::string> kMarkers = {
      "inc", "corp", "corporation", "ltd", "llc", "s.a", "sa", "s.l",
      "company", "bank", "banco", "university", "universidad", "group",
      "grupo", "ministry", "ministerio", "technologies", "systems",
      "foundation", "fundación"};
  return kMarkers;
}

const std::unordered_set<std::string> &LocationCues() {
  static const std::unordered_set<std::string> kCues = {
      "in", "en", "at", "from", "desde", "to", "hacia", "near", "cerca",
      "visit", "visitó", "visitar"};
  return kCues;
}

const std::unordered_set<std::string> &Connectors() {
  static const std::unordered_set<std::string> kConnectors = {
      "de", "del", "la", "las", "los", "of", "the", "y", "and", "&"};
  return kConnectors;
}

struct Token {
  std::string text; // stripped of surrounding punctuation
  std::size_t start{0};
  std::size_t end{0};
  bool ends_clause{false}; // followed by , ; : . ! ?
};

bool IsCapitalised(const std::string &word) {
  if (word.empty())
    return false;
  auto c = static_cast<unsigned char>(word[0]);
  if (std::isupper(c))
    return true;
  if (c == 0xC3 && word.size() > 1) {
    auto next = static_cast<unsigned char>(word[1]);
    return next >= 0x80 && next <= 0x9E && next != 0x97;
  }
  return false;
}

std::vector<Token> Tokenize(const std::string &input) {
  std::vector<Token> tokens;
  std::size_t i = 0;
  while (i < input.size()) {
    while (i < input.size() && std::isspace(static_cast<unsigned char>(input[i])))
      ++i;
    if (i >= input.size())
      break;
    std::size_t raw_start = i;
    while (i < input.size() && !std::isspace(static_cast<unsigned char>(input[i])))
      ++i;
    std::size_t start = raw_start;
    std::size_t end = i;
    while (start < end && std::strchr("\"'([{", input[start]) != nullptr)
      ++start;
    bool ends_clause = false;
    while (end > start && std::strchr(",;:.!?\"')]}", input[end - 1]) != nullptr) {
      ends_clause = true;
      --end;
    }
    if (end > start) {
      Token tok;
      tok.text = input.substr(start, end - start);
      tok.start = start;
      tok.end = end;
      tok.ends_clause = ends_clause;
      tokens.push_back(std::move(tok));
    }
  }
  return tokens;
}

std::string Bare(const std::string &word) {
  std::string out = text::Lowercase(word);
  while (!out.empty() && out.back() == '.')
    out.pop_back();
  return out;
}

bool Overlaps(const std::vector<Entity> &found, std::size_t start,
              std::size_t end) {
  for (const auto &e : found) {
    if (start < e.end && e.start < end)
      return true;
  }
  return false;
}

} // namespace

bool PatternNer::LoadResources(const ModelSpec &spec, std::string *error) {
  (void)spec;
  patterns_.clear();
  try {
    auto icase = std::regex::ECMAScript | std::regex::icase;
    patterns_.push_back(
        {"EMAIL",
         std::regex(R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,})")});
    patterns_.push_back(
        {"MONEY",
         std::regex(R"((?:\$|€|£|USD ?|EUR ?|MXN ?)\d(?:[\d.,]*\d)?)"
                    R"(|\d(?:[\d.,]*\d)? ?(?:USD|EUR|MXN|dollars|dólares|euros|pesos)\b)",
                    icase)});
    patterns_.push_back(
        {"DATE",
         std::regex(std::string(R"(\b\d{4}-\d{2}-\d{2}\b)"
                                R"(|\b\d{1,2}[/\-]\d{1,2}[/\-]\d{2,4}\b)"
                                R"(|\b\d{1,2} de )") +
                        kMonths + R"((?: de \d{4})?)" + "|\\b" + kMonths +
                        R"( \d{1,2}(?:, \d{4})?)",
                    icase)});
  } catch (const std::regex_error &ex) {
    if (error)
      *error = std::string("pattern compilation failed: ") + ex.what();
    return false;
  }
  return true;
}

std::vector<Entity> PatternNer::Extract(const std::string &input) const {
  std::vector<Entity> found;
  for (const auto &pattern : patterns_) {
    for (std::sregex_iterator it(input.begin(), input.end(), pattern.regex), end;
         it != end; ++it) {
      auto start = static_cast<std::size_t>(it->position(0));
      auto stop = start + static_cast<std::size_t>(it->length(0));
      if (Overlaps(found, start, stop))
        continue;
      found.push_back({pattern.type, it->str(0), start, stop, kPatternScore});
    }
  }

  auto tokens = Tokenize(input);
  std::size_t i = 0;
  while (i < tokens.size()) {
    if (!IsCapitalised(tokens[i].text) ||
        Overlaps(found, tokens[i].start, tokens[i].end)) {
      ++i;
      continue;
    }
    std::size_t first = i;
    bool titled = false;
    std::string prev = i > 0 ? Bare(tokens[i - 1].text) : std::string();
    if (Titles().count(prev)) {
      titled = true;
    } else if (Titles().count(Bare(tokens[i].text))) {
      // "Dr. Ramírez": the title opens the span but is not part of it.
      if (i + 1 >= tokens.size() || !IsCapitalised(tokens[i + 1].text)) {
        ++i;
        continue;
      }
      titled = true;
      prev = Bare(tokens[i].text);
      first = i + 1;
    }
    std::size_t last = first;
    while (!tokens[last].ends_clause && last + 1 < tokens.size()) {
      const auto &next = tokens[last + 1];
      if (IsCapitalised(next.text) && !Overlaps(found, next.start, next.end)) {
        ++last;
        continue;
      }
      // "Banco de México": a connector joins two capitalised words.
      if (Connectors().count(text::Lowercase(next.text)) && !next.ends_clause &&
          last + 2 < tokens.size() && IsCapitalised(tokens[last + 2].text)) {
        last += 2;
        continue;
      }
      break;
    }
    i = last + 1;

    bool org = false;
    for (std::size_t k = first; k <= last; ++k) {
      if (OrgMarkers().count(Bare(tokens[k].text))) {
        org = true;
        break;
      }
    }
    std::size_t words = last - first + 1;
    std::string type;
    double score = 0.0;
    if (org) {
      type = "ORG";
      score = 0.85;
    } else if (titled) {
      type = "PER";
      score = 0.85;
    } else if (LocationCues().count(prev)) {
      type = "LOC";
      score = 0.7;
    } else if (words >= 2) {
      type = "PER";
      score = 0.6;
    } else {
      continue; // lone capitalised word with no cue
    }
    auto start = tokens[first].start;
    auto stop = tokens[last].end;
    found.push_back({type, input.substr(start, stop - start), start, stop, score});
  }

  std::sort(found.begin(), found.end(),
            [](const Entity &a, const Entity &b) { return a.start < b.start; });
  return found;
}

nlohmann::json PatternNer::Run(const std::string &operation,
                               const nlohmann::json &input) {
  (void)operation;
  auto body = text::RequireText(input, "text");
  std::unordered_set<std::string> wanted;
  if (input.contains("entity_types") && !input.at("entity_types").is_null()) {
    if (!input.at("entity_types").is_array()) {
      throw std::invalid_argument("'entity_types' must be an array of strings");
    }
    for (const auto &t : input.at("entity_types")) {
      if (!t.is_string()) {
        throw std::invalid_argument("'entity_types' must be an array of strings");
      }
      wanted.insert(t.get<std::string>());
    }
  }
  nlohmann::json entities = nlohmann::json::array();
  for (const auto &e : Extract(body)) {
    if (!wanted.empty() && !wanted.count(e.type))
      continue;
    entities.push_back({{"type", e.type},
                        {"text", e.text},
                        {"start", e.start},
                        {"end", e.end},
                        {"score", e.score}});
  }
  return {{"entities", std::move(entities)}};
}

nlohmann::json PatternNer::Describe() const {
  return {{"entity_types", {"PER", "ORG", "LOC", "DATE", "MONEY", "EMAIL"}}};
}

} // namespace modelgate
