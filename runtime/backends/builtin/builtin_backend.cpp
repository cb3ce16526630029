#include "runtime/backends/builtin/builtin_backend.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace modelgate {

bool BuiltinBackend::Load(const ModelSpec &spec, std::string *error) {
  model_id_ = spec.id;
  if (!LoadResources(spec, error)) {
    return false;
  }
  ready_.store(true);
  log::Debug("builtin", Name() + " ready", "model=" + spec.id);
  return true;
}

void BuiltinBackend::Unload() {
  ready_.store(false);
  ReleaseResources();
}

nlohmann::json BuiltinBackend::Invoke(const std::string &operation,
                                      const nlohmann::json &input) {
  if (!ready_.load()) {
    throw std::runtime_error(Name() + " backend is not loaded");
  }
  if (operation == "info") {
    auto info = Describe();
    info["model"] = model_id_;
    info["backend"] = Name();
    info["operations"] = Operations();
    return info;
  }
  auto ops = RunOperations();
  if (std::find(ops.begin(), ops.end(), operation) == ops.end()) {
    throw std::invalid_argument("operation '" + operation +
                                "' is not supported by " + Name());
  }
  return Run(operation, input);
}

std::vector<std::string> BuiltinBackend::Operations() const {
  auto ops = RunOperations();
  ops.push_back("info");
  return ops;
}

} // namespace modelgate
