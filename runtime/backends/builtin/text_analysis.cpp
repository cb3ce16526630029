#include "runtime/backends/builtin/text_analysis.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace modelgate {
namespace text {

namespace {

bool IsWordByte(unsigned char c) {
  return std::isalnum(c) || c >= 0x80;
}

std::string Trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

const std::unordered_set<std::string> &Stopwords() {
  static const std::unordered_set<std::string> kStopwords = {
      // en
      "a", "an", "and", "are", "as", "at", "be", "but", "by", "for", "from",
      "has", "have", "he", "her", "his", "i", "in", "is", "it", "its", "of",
      "on", "or", "our", "she", "so", "that", "the", "their", "them", "they",
      "this", "to", "was", "we", "were", "which", "will", "with", "you",
      // es
      "al", "como", "con", "de", "del", "el", "ella", "en", "es", "esta",
      "este", "la", "las", "lo", "los", "mas", "más", "mi", "no", "nos",
      "para", "pero", "por", "que", "se", "si", "sin", "sobre", "su", "sus",
      "un", "una", "uno", "y", "ya"};
  return kStopwords;
}

} // namespace

std::string Lowercase(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    auto c = static_cast<unsigned char>(input[i]);
    if (c == 0xC3 && i + 1 < input.size()) {
      auto next = static_cast<unsigned char>(input[i + 1]);
      // U+00C0..U+00DE map to U+00E0..U+00FE, except U+00D7 (multiplication sign).
      if (next >= 0x80 && next <= 0x9E && next != 0x97) {
        next = static_cast<unsigned char>(next + 0x20);
      }
      out.push_back(static_cast<char>(c));
      out.push_back(static_cast<char>(next));
      ++i;
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

std::vector<std::string> Words(const std::string &input) {
  std::vector<std::string> words;
  std::string current;
  for (char ch : input) {
    if (IsWordByte(static_cast<unsigned char>(ch))) {
      current.push_back(ch);
    } else if (!current.empty()) {
      words.push_back(Lowercase(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(Lowercase(current));
  }
  return words;
}

std::vector<std::string> RawTokens(const std::string &input) {
  std::vector<std::string> tokens;
  std::string current;
  for (char ch : input) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::vector<std::string> SplitSentences(const std::string &input) {
  std::vector<std::string> sentences;
  std::string current;
  auto flush = [&]() {
    auto trimmed = Trim(current);
    if (!trimmed.empty()) {
      sentences.push_back(trimmed);
    }
    current.clear();
  };
  for (std::size_t i = 0; i < input.size(); ++i) {
    char ch = input[i];
    current.push_back(ch);
    if (ch == '.' || ch == '!' || ch == '?') {
      // Keep "3.5" and "e.g." style dots inside the sentence.
      bool next_is_space = i + 1 >= input.size() ||
                           std::isspace(static_cast<unsigned char>(input[i + 1]));
      if (next_is_space) {
        flush();
      }
    } else if (ch == '\n' && i + 1 < input.size() && input[i + 1] == '\n') {
      flush();
    }
  }
  flush();
  return sentences;
}

bool IsStopword(const std::string &lower_word) {
  return Stopwords().count(lower_word) > 0;
}

uint64_t Fnv1a(const std::string &input) {
  uint64_t hash = 1469598103934665603ULL;
  for (unsigned char c : input) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

bool LoadTabSeparated(const std::string &path,
                      std::vector<std::pair<std::string, std::string>> *rows,
                      std::string *error) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (error)
      *error = "cannot open " + path;
    return false;
  }
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty() || line[0] == '#')
      continue;
    auto tab = line.find('\t');
    if (tab == std::string::npos) {
      if (error)
        *error = path + ":" + std::to_string(line_no) + ": missing tab separator";
      return false;
    }
    rows->emplace_back(Trim(line.substr(0, tab)), Trim(line.substr(tab + 1)));
  }
  return true;
}

std::string RequireText(const nlohmann::json &input, const char *field) {
  if (!input.is_object() || !input.contains(field)) {
    throw std::invalid_argument(std::string("'") + field + "' is required");
  }
  const auto &value = input.at(field);
  if (!value.is_string()) {
    throw std::invalid_argument(std::string("'") + field + "' must be a string");
  }
  auto text = value.get<std::string>();
  if (Trim(text).empty()) {
    throw std::invalid_argument(std::string("'") + field + "' must not be empty");
  }
  return text;
}

int OptionalInt(const nlohmann::json &input, const char *field, int fallback) {
  if (!input.is_object() || !input.contains(field) || input.at(field).is_null())
    return fallback;
  const auto &value = input.at(field);
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string("'") + field + "' must be an integer");
  }
  return value.get<int>();
}

bool OptionalBool(const nlohmann::json &input, const char *field,
                  bool fallback) {
  if (!input.is_object() || !input.contains(field) || input.at(field).is_null())
    return fallback;
  const auto &value = input.at(field);
  if (!value.is_boolean()) {
    throw std::invalid_argument(std::string("'") + field + "' must be a boolean");
  }
  return value.get<bool>();
}

} // namespace text
} // namespace modelgate
