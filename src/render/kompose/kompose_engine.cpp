#include "render/kompose/kompose_engine.hpp"

#include "core/logging/logger.hpp"
#include "host/action_host.hpp"
#include "process/process_runner.hpp"
#include "render/engine_support.hpp"
#include "render/template_path.hpp"

namespace kbake::render::kompose {

std::vector<std::string> BuildKomposeConvertArgs(const std::string& compose_file,
                                                 const std::filesystem::path& output_path) {
  return {"convert", "-f", compose_file, "-o", output_path.string()};
}

bool KomposeRenderEngine::Bake(std::filesystem::path& manifest_path, BakeError& error) {
  std::string compose_file;
  if (!ReadEngineInput(services_, "dockerComposeFile", true, compose_file, error)) {
    return false;
  }
  if (!RequireExistingPath(compose_file,
                           "Docker compose file path " + compose_file +
                               " does not exist. Please check the path specified",
                           error)) {
    return false;
  }

  std::string kompose_path;
  if (!ResolveEngineTool(services_, "kompose", kompose_path, error)) {
    return false;
  }

  std::filesystem::path baked_path;
  if (!services_.template_paths.GetTemplatePath(baked_path, error)) {
    return false;
  }

  services_.host.Debug("Running kompose command..");
  process::ProcessResult result;
  if (!RunEngineTool(services_, kompose_path, BuildKomposeConvertArgs(compose_file, baked_path),
                     process::ProcessOptions{}, result, error)) {
    return false;
  }

  if (!PublishBakedManifest(services_, baked_path, error)) {
    return false;
  }
  manifest_path = baked_path;
  return true;
}

} // namespace kbake::render::kompose
