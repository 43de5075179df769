#pragma once

#include "render/render_engine.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kbake::render::helm {

// One `--set` override. Parsed from `name:value`; only the first colon
// separates, so "image.tag:v1:rc" keeps "v1:rc" as the value.
struct OverridePair {
  std::string name;
  std::string value;
};

OverridePair ParseOverridePair(std::string_view token);

// Splits a newline-delimited input into entries, dropping a trailing '\r'
// from each and skipping blank entries.
std::vector<std::string> SplitInputLines(std::string_view raw);

struct HelmTemplateConfig {
  std::string chart_path;
  std::string release_name;
  std::vector<std::string> override_files;
  std::vector<OverridePair> overrides;
};

// Argument order is fixed:
//   template <chart> [--name <release>] (-f <file>)... (--set <name>=<value>)...
std::vector<std::string> BuildHelmTemplateArgs(const HelmTemplateConfig& config);

// Renders a Helm 2 chart with `helm template` and writes the captured stdout
// to a fresh manifest path.
class HelmRenderEngine final : public IRenderEngine {
public:
  explicit HelmRenderEngine(EngineServices services) : services_(services) {}

  EngineKind Kind() const override {
    return EngineKind::kHelm;
  }

  bool Bake(std::filesystem::path& manifest_path, BakeError& error) override;

private:
  bool ReadConfig(HelmTemplateConfig& config, BakeError& error);

  EngineServices services_;
};

} // namespace kbake::render::helm
