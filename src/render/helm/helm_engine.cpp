#include "render/helm/helm_engine.hpp"

#include "core/logging/logger.hpp"
#include "host/action_host.hpp"
#include "process/process_runner.hpp"
#include "render/engine_support.hpp"
#include "render/template_path.hpp"

namespace kbake::render::helm {

namespace {

constexpr std::string_view kHelmTool = "helm";

} // namespace

OverridePair ParseOverridePair(std::string_view token) {
  OverridePair pair;
  const std::size_t colon = token.find(':');
  if (colon == std::string_view::npos) {
    pair.name = std::string(token);
    return pair;
  }
  pair.name = std::string(token.substr(0, colon));
  pair.value = std::string(token.substr(colon + 1));
  return pair;
}

std::vector<std::string> SplitInputLines(std::string_view raw) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin <= raw.size()) {
    std::size_t end = raw.find('\n', begin);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    std::string_view line = raw.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      lines.emplace_back(line);
    }
    begin = end + 1;
  }
  return lines;
}

std::vector<std::string> BuildHelmTemplateArgs(const HelmTemplateConfig& config) {
  std::vector<std::string> args;
  args.reserve(2U + 2U + config.override_files.size() * 2U + config.overrides.size() * 2U);
  args.push_back("template");
  args.push_back(config.chart_path);

  if (!config.release_name.empty()) {
    args.push_back("--name");
    args.push_back(config.release_name);
  }

  for (const std::string& file : config.override_files) {
    args.push_back("-f");
    args.push_back(file);
  }

  for (const OverridePair& override_value : config.overrides) {
    args.push_back("--set");
    args.push_back(override_value.name + "=" + override_value.value);
  }

  return args;
}

bool HelmRenderEngine::ReadConfig(HelmTemplateConfig& config, BakeError& error) {
  config = HelmTemplateConfig{};
  if (!ReadEngineInput(services_, "releaseName", false, config.release_name, error) ||
      !ReadEngineInput(services_, "helmChart", true, config.chart_path, error)) {
    return false;
  }

  std::string override_files;
  if (!ReadEngineInput(services_, "overrideFiles", false, override_files, error)) {
    return false;
  }
  if (!override_files.empty()) {
    services_.host.Debug("Adding overrides file inputs");
    config.override_files = SplitInputLines(override_files);
  }

  std::string overrides;
  if (!ReadEngineInput(services_, "overrides", false, overrides, error)) {
    return false;
  }
  if (!overrides.empty()) {
    services_.host.Debug("Adding overrides inputs");
    for (const std::string& token : SplitInputLines(overrides)) {
      config.overrides.push_back(ParseOverridePair(token));
    }
  }
  return true;
}

bool HelmRenderEngine::Bake(std::filesystem::path& manifest_path, BakeError& error) {
  services_.host.Info("in HelmRenderEngine");

  std::string helm_path;
  if (!ResolveEngineTool(services_, kHelmTool, helm_path, error)) {
    return false;
  }

  services_.host.Debug("Creating the template argument string..");
  HelmTemplateConfig config;
  if (!ReadConfig(config, error)) {
    return false;
  }
  const std::vector<std::string> args = BuildHelmTemplateArgs(config);
  services_.logger.Debug("helm template arguments built",
                         {{"chart", config.chart_path},
                          {"override_files", std::to_string(config.override_files.size())},
                          {"overrides", std::to_string(config.overrides.size())}});

  services_.host.Debug("Running helm template command..");
  process::ProcessOptions options;
  options.silent = true;
  process::ProcessResult result;
  if (!RunEngineTool(services_, helm_path, args, options, result, error)) {
    return false;
  }

  std::filesystem::path baked_path;
  if (!services_.template_paths.GetTemplatePath(baked_path, error) ||
      !WriteBakedManifest(baked_path, result.stdout_text, error) ||
      !PublishBakedManifest(services_, baked_path, error)) {
    return false;
  }

  manifest_path = baked_path;
  return true;
}

} // namespace kbake::render::helm
