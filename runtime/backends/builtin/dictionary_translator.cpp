#include "runtime/backends/builtin/dictionary_translator.h"

#include "runtime/backends/builtin/text_analysis.h"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace modelgate {

namespace {

const std::vector<std::pair<const char *, const char *>> &BuiltinDictionary() {
  static const std::vector<std::pair<const char *, const char *>> kPairs = {
      {"hola", "hello"},          {"adiós", "goodbye"},
      {"gracias", "thanks"},      {"por favor", "please"},
      {"buenos días", "good morning"},
      {"buenas noches", "good night"},
      {"el", "the"},              {"la", "the"},
      {"los", "the"},             {"las", "the"},
      {"un", "a"},                {"una", "a"},
      {"y", "and"},               {"o", "or"},
      {"pero", "but"},            {"con", "with"},
      {"sin", "without"},         {"para", "for"},
      {"de", "of"},               {"en", "in"},
      {"es", "is"},               {"son", "are"},
      {"está", "is"},             {"no", "not"},
      {"muy", "very"},            {"yo", "i"},
      {"nosotros", "we"},         {"ellos", "they"},
      {"cliente", "customer"},    {"clientes", "customers"},
      {"producto", "product"},    {"productos", "products"},
      {"servicio", "service"},    {"empresa", "company"},
      {"precio", "price"},        {"pedido", "order"},
      {"entrega", "delivery"},    {"factura", "invoice"},
      {"pago", "payment"},        {"cuenta", "account"},
      {"problema", "problem"},    {"soporte", "support"},
      {"técnico", "technical"},   {"rápido", "fast"},
      {"lento", "slow"},          {"bueno", "good"},
      {"malo", "bad"},            {"nuevo", "new"},
      {"grande", "big"},          {"pequeño", "small"},
      {"hoy", "today"},           {"mañana", "tomorrow"},
      {"semana", "week"},         {"mes", "month"},
      {"año", "year"},            {"funciona", "works"},
      {"necesito", "i need"},     {"quiero", "i want"},
      {"tengo", "i have"},        {"ayuda", "help"},
      {"reunión", "meeting"},     {"informe", "report"},
      {"ventas", "sales"},        {"equipo", "team"}};
  return kPairs;
}

std::string Capitalise(std::string word) {
  if (!word.empty())
    word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
  return word;
}

bool StartsUpper(const std::string &word) {
  return !word.empty() && std::isupper(static_cast<unsigned char>(word[0]));
}

struct Piece {
  std::string word;  // as written
  std::string lower; // dictionary key
  std::string trailing; // punctuation after the word
};

std::vector<Piece> Split(const std::string &input) {
  std::vector<Piece> pieces;
  for (const auto &token : text::RawTokens(input)) {
    Piece p;
    std::size_t end = token.size();
    while (end > 0 && std::ispunct(static_cast<unsigned char>(token[end - 1])))
      --end;
    p.word = token.substr(0, end);
    p.trailing = token.substr(end);
    p.lower = text::Lowercase(p.word);
    pieces.push_back(std::move(p));
  }
  return pieces;
}

} // namespace

bool DictionaryTranslator::SupportedPair(const std::string &source,
                                         const std::string &target) {
  return (source == "es" && target == "en") || (source == "en" && target == "es");
}

void DictionaryTranslator::AddPair(const std::string &es, const std::string &en) {
  auto es_key = text::Lowercase(es);
  auto en_key = text::Lowercase(en);
  es_en_.emplace(es_key, en_key);
  en_es_.emplace(en_key, es_key);
}

bool DictionaryTranslator::LoadResources(const ModelSpec &spec,
                                         std::string *error) {
  ReleaseResources();
  if (spec.path.empty()) {
    for (const auto &[es, en] : BuiltinDictionary()) {
      AddPair(es, en);
    }
    return true;
  }
  std::vector<std::pair<std::string, std::string>> rows;
  if (!text::LoadTabSeparated(spec.path, &rows, error))
    return false;
  for (const auto &[es, en] : rows) {
    AddPair(es, en);
  }
  if (es_en_.empty()) {
    if (error)
      *error = "dictionary file is empty: " + spec.path;
    return false;
  }
  return true;
}

void DictionaryTranslator::ReleaseResources() {
  es_en_.clear();
  en_es_.clear();
}

Translation DictionaryTranslator::Translate(const std::string &input,
                                            const std::string &source,
                                            const std::string &target) const {
  if (!SupportedPair(source, target)) {
    throw std::invalid_argument("unsupported language pair " + source + "->" +
                                target + "; supported: es<->en");
  }
  const auto &dict = source == "es" ? es_en_ : en_es_;
  auto pieces = Split(input);
  Translation out;
  std::size_t i = 0;
  while (i < pieces.size()) {
    std::string translated;
    std::size_t used = 1;
    if (i + 1 < pieces.size() && pieces[i].trailing.empty()) {
      auto it = dict.find(pieces[i].lower + " " + pieces[i + 1].lower);
      if (it != dict.end()) {
        translated = it->second;
        used = 2;
      }
    }
    if (used == 1) {
      auto it = dict.find(pieces[i].lower);
      if (it != dict.end()) {
        translated = it->second;
      } else {
        translated = pieces[i].word;
        if (!pieces[i].word.empty())
          ++out.unknown;
      }
    }
    if (StartsUpper(pieces[i].word))
      translated = Capitalise(translated);
    if (!out.text.empty())
      out.text.push_back(' ');
    out.text += translated + pieces[i + used - 1].trailing;
    out.words += used;
    i += used;
  }
  return out;
}

nlohmann::json DictionaryTranslator::Run(const std::string &operation,
                                         const nlohmann::json &input) {
  (void)operation;
  auto body = text::RequireText(input, "text");
  std::string source = input.value("source_lang", std::string("es"));
  std::string target = input.value("target_lang", std::string("en"));
  auto result = Translate(body, source, target);
  double coverage =
      result.words == 0
          ? 0.0
          : 1.0 - static_cast<double>(result.unknown) /
                      static_cast<double>(result.words);
  return {{"translation", result.text},
          {"source_lang", source},
          {"target_lang", target},
          {"unknown_words", result.unknown},
          {"coverage", coverage}};
}

nlohmann::json DictionaryTranslator::Describe() const {
  return {{"pairs", {"es->en", "en->es"}}, {"entries", es_en_.size()}};
}

} // namespace modelgate
