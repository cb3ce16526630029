#include "scheduler/model_catalog.h"

#include "runtime/backends/backend_factory.h"

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

namespace modelgate {

namespace {

const std::vector<std::pair<std::string, std::string>> &TaskKinds() {
  static const std::vector<std::pair<std::string, std::string>> kTaskKinds = {
      {"chat", "llm"},          {"completion", "llm"},
      {"transcribe", "speech"}, {"embed", "embedding"},
      {"ocr", "ocr"},           {"classify", "classifier"},
      {"sentiment", "sentiment"}, {"entities", "ner"},
      {"summarize", "summarizer"}, {"translate", "translator"}};
  return kTaskKinds;
}

constexpr int64_t kBytesPerMb = 1024 * 1024;

} // namespace

std::string ModelCatalog::KindForTask(const std::string &task) {
  for (const auto &[name, kind] : TaskKinds()) {
    if (name == task)
      return kind;
  }
  return {};
}

std::vector<std::string> ModelCatalog::Tasks() {
  std::vector<std::string> tasks;
  for (const auto &[name, kind] : TaskKinds())
    tasks.push_back(name);
  return tasks;
}

int64_t ModelCatalog::FootprintMb(const ModelSpec &spec) {
  if (spec.memory_mb > 0)
    return spec.memory_mb;
  if (spec.path.empty())
    return 0;
  std::error_code ec;
  auto bytes = std::filesystem::file_size(spec.path, ec);
  if (ec)
    return 0;
  auto mb = static_cast<int64_t>((bytes + kBytesPerMb - 1) / kBytesPerMb);
  return mb < 1 ? 1 : mb;
}

void ModelCatalog::Add(ModelSpec spec) {
  // Duplicates are kept so Validate() can report them.
  index_.emplace(spec.id, specs_.size());
  specs_.push_back(std::move(spec));
}

void ModelCatalog::SetRoute(const std::string &task,
                            const std::string &model_id) {
  routes_[task] = model_id;
}

const ModelSpec *ModelCatalog::Find(const std::string &id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &specs_[it->second];
}

GatewayError ModelCatalog::ResolveModel(const std::string &task,
                                        const std::string &requested,
                                        std::string *model_id) const {
  auto kind = KindForTask(task);
  if (kind.empty()) {
    return GatewayError::Validation("unknown task '" + task + "'");
  }
  if (!requested.empty()) {
    const auto *spec = Find(requested);
    if (!spec) {
      return GatewayError::Validation("unknown model '" + requested + "'");
    }
    if (spec->kind != kind) {
      return GatewayError::Validation("model '" + requested +
                                      "' cannot serve " + task + " requests");
    }
    *model_id = spec->id;
    return GatewayError::Ok();
  }
  auto route = routes_.find(task);
  if (route != routes_.end()) {
    *model_id = route->second;
    return GatewayError::Ok();
  }
  for (const auto &spec : specs_) {
    if (spec.kind == kind) {
      *model_id = spec.id;
      return GatewayError::Ok();
    }
  }
  return GatewayError::ModelUnavailable("no_model",
                                        "no model is configured for " + task);
}

std::vector<std::string> ModelCatalog::Validate(int64_t budget_mb) const {
  std::vector<std::string> problems;
  std::set<std::string> seen;
  int64_t pinned_mb = 0;
  const auto builtin = BackendFactory::BuiltinKinds();

  for (const auto &spec : specs_) {
    if (spec.id.empty()) {
      problems.push_back("model with empty id");
      continue;
    }
    if (!seen.insert(spec.id).second) {
      problems.push_back("duplicate model id '" + spec.id + "'");
    }
    if (!BackendFactory::KnownKind(spec.kind)) {
      problems.push_back("model '" + spec.id + "' has unknown kind '" +
                         spec.kind + "'");
    }
    auto colon = spec.id.find(':');
    if (colon != std::string::npos && spec.id.substr(0, colon) != spec.kind) {
      problems.push_back("model '" + spec.id + "' id prefix does not match kind '" +
                         spec.kind + "'");
    }
    if (!BackendFactory::KnownProvider(spec.provider)) {
      problems.push_back("model '" + spec.id + "' has unknown provider '" +
                         spec.provider + "'");
    } else if (spec.provider == "builtin" &&
               std::find(builtin.begin(), builtin.end(), spec.kind) == builtin.end() &&
               BackendFactory::KnownKind(spec.kind)) {
      problems.push_back("model '" + spec.id + "': kind '" + spec.kind +
                         "' has no built-in backend; use provider: http");
    } else if (spec.provider == "http" && spec.endpoint.empty()) {
      problems.push_back("model '" + spec.id + "' needs an endpoint");
    }
    auto footprint = FootprintMb(spec);
    if (budget_mb > 0 && footprint > budget_mb) {
      problems.push_back("model '" + spec.id + "' needs " +
                         std::to_string(footprint) + " MB, more than the " +
                         std::to_string(budget_mb) + " MB budget");
    }
    if (spec.pinned)
      pinned_mb += footprint;
  }
  if (budget_mb > 0 && pinned_mb > budget_mb) {
    problems.push_back("pinned models need " + std::to_string(pinned_mb) +
                       " MB, more than the " + std::to_string(budget_mb) +
                       " MB budget");
  }
  for (const auto &[task, model_id] : routes_) {
    auto kind = KindForTask(task);
    if (kind.empty()) {
      problems.push_back("route for unknown task '" + task + "'");
      continue;
    }
    const auto *spec = Find(model_id);
    if (!spec) {
      problems.push_back("route " + task + " -> unknown model '" + model_id + "'");
    } else if (spec->kind != kind) {
      problems.push_back("route " + task + " -> '" + model_id + "' of kind " +
                         spec->kind + ", expected " + kind);
    }
  }
  return problems;
}

} // namespace modelgate
