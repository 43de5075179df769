#include "render/engine_selector.hpp"

#include "render/helm/helm_engine.hpp"
#include "render/kompose/kompose_engine.hpp"
#include "render/kustomize/kustomize_engine.hpp"

namespace kbake::render {

namespace {

constexpr std::string_view kEngineHelm = "helm2";
constexpr std::string_view kEngineKompose = "kompose";
constexpr std::string_view kEngineKustomize = "kustomize";

} // namespace

std::string_view ToString(EngineKind kind) {
  switch (kind) {
  case EngineKind::kHelm:
    return kEngineHelm;
  case EngineKind::kKompose:
    return kEngineKompose;
  case EngineKind::kKustomize:
    return kEngineKustomize;
  }
  return kEngineHelm;
}

std::vector<std::string_view> SupportedEngineNames() {
  return {kEngineHelm, kEngineKompose, kEngineKustomize};
}

bool ParseEngineKind(std::string_view name, EngineKind& kind, BakeError& error) {
  if (name == kEngineHelm) {
    kind = EngineKind::kHelm;
    return true;
  }
  if (name == kEngineKompose) {
    kind = EngineKind::kKompose;
    return true;
  }
  if (name == kEngineKustomize) {
    kind = EngineKind::kKustomize;
    return true;
  }

  error.Set(BakeErrorKind::kUnknownEngine, "Unknown render engine: " + std::string(name));
  return false;
}

std::unique_ptr<IRenderEngine> CreateRenderEngine(EngineKind kind, EngineServices services) {
  switch (kind) {
  case EngineKind::kHelm:
    return std::make_unique<helm::HelmRenderEngine>(services);
  case EngineKind::kKompose:
    return std::make_unique<kompose::KomposeRenderEngine>(services);
  case EngineKind::kKustomize:
    return std::make_unique<kustomize::KustomizeRenderEngine>(services);
  }
  return std::make_unique<helm::HelmRenderEngine>(services);
}

bool SelectRenderEngine(std::string_view name, EngineServices services,
                        std::unique_ptr<IRenderEngine>& engine, BakeError& error) {
  EngineKind kind = EngineKind::kHelm;
  if (!ParseEngineKind(name, kind, error)) {
    return false;
  }
  engine = CreateRenderEngine(kind, services);
  return true;
}

} // namespace kbake::render
