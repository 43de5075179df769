#pragma once

#include "render/render_engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace kbake::render::kompose {

// `convert -f <compose file> -o <manifest path>`
std::vector<std::string> BuildKomposeConvertArgs(const std::string& compose_file,
                                                 const std::filesystem::path& output_path);

// Converts a Docker Compose file with `kompose convert`. Unlike the other
// engines, kompose writes the manifest itself via `-o`; stdout is not
// captured into the file.
class KomposeRenderEngine final : public IRenderEngine {
public:
  explicit KomposeRenderEngine(EngineServices services) : services_(services) {}

  EngineKind Kind() const override {
    return EngineKind::kKompose;
  }

  bool Bake(std::filesystem::path& manifest_path, BakeError& error) override;

private:
  EngineServices services_;
};

} // namespace kbake::render::kompose
