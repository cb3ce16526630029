#pragma once

#include "runtime/backends/inference_backend.h"

#include <memory>
#include <string>
#include <vector>

namespace modelgate {

class BackendFactory {
public:
  // Returns an unloaded backend for the spec, or nullptr when no
  // implementation exists for its provider/kind pair.
  static std::unique_ptr<InferenceBackend> Create(const ModelSpec &spec);

  static bool KnownKind(const std::string &kind);
  static bool KnownProvider(const std::string &provider);
  // Kinds with a built-in implementation.
  static std::vector<std::string> BuiltinKinds();
};

} // namespace modelgate
