#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace modelgate {
namespace text {

// Lowercases ASCII and the accented Latin-1 capitals (Á, É, Ñ, ...) encoded as
// two-byte UTF-8. Other bytes pass through unchanged.
std::string Lowercase(const std::string &input);

// Lowercased word tokens. Any byte >= 0x80 counts as a letter so UTF-8 words
// ("canción", "año") stay whole.
std::vector<std::string> Words(const std::string &input);

// Whitespace-separated tokens, case and punctuation preserved.
std::vector<std::string> RawTokens(const std::string &input);

// Splits on '.', '!', '?' and blank lines; trims each sentence.
std::vector<std::string> SplitSentences(const std::string &input);

bool IsStopword(const std::string &lower_word);

// 64-bit FNV-1a.
uint64_t Fnv1a(const std::string &input);

// Reads "<left>\t<right>" lines; '#' starts a comment line.
bool LoadTabSeparated(const std::string &path,
                      std::vector<std::pair<std::string, std::string>> *rows,
                      std::string *error);

// Input accessors for backend payloads. All throw std::invalid_argument.
std::string RequireText(const nlohmann::json &input, const char *field);
int OptionalInt(const nlohmann::json &input, const char *field, int fallback);
bool OptionalBool(const nlohmann::json &input, const char *field,
                  bool fallback);

} // namespace text
} // namespace modelgate
