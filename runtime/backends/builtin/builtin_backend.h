#pragma once

#include "runtime/backends/inference_backend.h"

#include <atomic>
#include <string>
#include <vector>

namespace modelgate {

// Common lifecycle for the in-process backends: Load() records the model id
// and defers to LoadResources(); Invoke() rejects calls while unloaded and
// answers the shared "info" operation itself.
class BuiltinBackend : public InferenceBackend {
public:
  bool Load(const ModelSpec &spec, std::string *error) override;
  void Unload() override;
  bool IsReady() const override { return ready_.load(); }
  nlohmann::json Invoke(const std::string &operation,
                        const nlohmann::json &input) override;
  std::vector<std::string> Operations() const override;

protected:
  virtual bool LoadResources(const ModelSpec &spec, std::string *error) = 0;
  virtual void ReleaseResources() {}
  virtual nlohmann::json Run(const std::string &operation,
                             const nlohmann::json &input) = 0;
  virtual std::vector<std::string> RunOperations() const = 0;
  virtual nlohmann::json Describe() const { return nlohmann::json::object(); }

  const std::string &model_id() const { return model_id_; }

private:
  std::string model_id_;
  std::atomic<bool> ready_{false};
};

} // namespace modelgate
