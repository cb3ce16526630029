#pragma once

#include "runtime/backends/builtin/builtin_backend.h"

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace modelgate {

struct Entity {
  std::string type; // PER, ORG, LOC, DATE, MONEY, EMAIL
  std::string text;
  std::size_t start{0}; // byte offsets into the input
  std::size_t end{0};
  double score{0.0};
};

// Rule-based entity extraction. EMAIL, MONEY and DATE come from regular
// expressions; PER, ORG and LOC from runs of capitalised words classified by
// the word before them ("Dr.", "en", "from") or by organisation suffixes
// ("Inc", "S.A.", "Banco").
class PatternNer : public BuiltinBackend {
public:
  std::string Name() const override { return "pattern_ner"; }

  std::vector<Entity> Extract(const std::string &text) const;

protected:
  bool LoadResources(const ModelSpec &spec, std::string *error) override;
  nlohmann::json Run(const std::string &operation,
                     const nlohmann::json &input) override;
  std::vector<std::string> RunOperations() const override {
    return {"entities"};
  }
  nlohmann::json Describe() const override;

private:
  struct Pattern {
    std::string type;
    std::regex regex;
  };
  std::vector<Pattern> patterns_;
};

} // namespace modelgate
