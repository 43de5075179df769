#include "render/kustomize/kustomize_engine.hpp"

#include "core/logging/logger.hpp"
#include "host/action_host.hpp"
#include "process/process_runner.hpp"
#include "render/engine_support.hpp"
#include "render/kustomize/version_gate.hpp"
#include "render/template_path.hpp"

#include <string>
#include <vector>

namespace kbake::render::kustomize {

bool KustomizeRenderEngine::ValidateClientVersion(const std::string& kubectl_path,
                                                  BakeError& error) {
  process::ProcessResult result;
  if (!RunEngineTool(services_, kubectl_path, {"version", "--client=true", "-o", "json"},
                     process::ProcessOptions{}, result, error)) {
    return false;
  }

  if (result.stdout_text.find_first_not_of(" \t\r\n") == std::string::npos) {
    services_.logger.Warn("kubectl printed no client version; skipping version check");
  }
  if (!CheckKustomizeClientVersion(result.stdout_text, error)) {
    services_.logger.Error("kubectl client version rejected", {{"error", error.message}});
    return false;
  }
  return true;
}

bool KustomizeRenderEngine::Bake(std::filesystem::path& manifest_path, BakeError& error) {
  std::string kubectl_path;
  if (!ResolveEngineTool(services_, "kubectl", kubectl_path, error) ||
      !ValidateClientVersion(kubectl_path, error)) {
    return false;
  }

  std::string kustomization_path;
  if (!ReadEngineInput(services_, "kustomizationPath", true, kustomization_path, error)) {
    return false;
  }
  if (!RequireExistingPath(kustomization_path,
                           "kustomizationPath " + kustomization_path +
                               " does not exist. Please check whether file exists or not.",
                           error)) {
    return false;
  }

  const std::vector<std::string> args = {"kustomize", kustomization_path};
  services_.host.Debug("Running kubectl kustomize command..");
  // Silent runs suppress the runner's own echo; keep the command visible.
  services_.host.Info("[command] " + kubectl_path + " kustomize " + kustomization_path);

  process::ProcessOptions options;
  options.silent = true;
  process::ProcessResult result;
  if (!RunEngineTool(services_, kubectl_path, args, options, result, error)) {
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

} // namespace kbake::render::kustomize
