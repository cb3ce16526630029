#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct Translation {
  std::string text;
  std::size_t words{0};
  std::size_t unknown{0};
};

// Word-for-word es <-> en translation from a bilingual dictionary. Two-word
// phrases are tried before single words; unknown words pass through and a
// leading capital is carried over to the translated word.
//
// spec.path may name an "es<TAB>en" dictionary file replacing the built-in one.
class DictionaryTranslator : public BuiltinBackend {
public:
  std::string Name() const override { return "dictionary_translator"; }

  static bool SupportedPair(const std::string &source,
                            const std::string &target);
  Translation Translate(const std::string &text, const std::string &source,
                        const std::string &target) const;

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  void ReleaseResources() override;
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override {
    return {"translate"};
  }
  nlohmann::json Describe() const override;

private:
  void AddPair(const std::string &es, const std::string &en);

  std::unordered_map<std::string, std::string> es_en_;
  std::unordered_map<std::string, std::string> en_es_;
};

} // namespace modelgate
