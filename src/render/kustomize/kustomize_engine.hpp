#pragma once

#include "render/render_engine.hpp"

#include <string>

namespace kbake::render::kustomize {

// Builds a kustomization directory with `kubectl kustomize`, after checking
// that the client is new enough to carry the subcommand.
class KustomizeRenderEngine final : public IRenderEngine {
public:
  explicit KustomizeRenderEngine(EngineServices services) : services_(services) {}

  EngineKind Kind() const override {
    return EngineKind::kKustomize;
  }

  bool Bake(std::filesystem::path& manifest_path, BakeError& error) override;

private:
  bool ValidateClientVersion(const std::string& kubectl_path, BakeError& error);

  EngineServices services_;
};

} // namespace kbake::render::kustomize
