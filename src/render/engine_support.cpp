#include "render/engine_support.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "host/action_host.hpp"
#include "process/tool_locator.hpp"

#include <utility>

namespace kbake::render {

bool ReadEngineInput(EngineServices& services, std::string_view name, bool required,
                     std::string& value, BakeError& error) {
  std::string input_error;
  if (!services.host.GetInput(name, required, value, input_error)) {
    error.Set(BakeErrorKind::kRequiredInputMissing, std::move(input_error));
    return false;
  }
  return true;
}

bool ResolveEngineTool(EngineServices& services, std::string_view tool,
                       std::string& executable_path, BakeError& error) {
  std::string locate_error;
  if (!services.tools.Resolve(tool, executable_path, locate_error)) {
    error.Set(BakeErrorKind::kExternalTool, std::move(locate_error));
    return false;
  }
  services.logger.Debug("renderer resolved", {{"tool", tool}, {"path", executable_path}});
  return true;
}

bool RunEngineTool(EngineServices& services, const std::string& executable,
                   const std::vector<std::string>& args, const process::ProcessOptions& options,
                   process::ProcessResult& result, BakeError& error) {
  services.logger.Debug("invoking renderer",
                        {{"command", process::FormatCommandLine(executable, args)},
                         {"silent", options.silent ? "true" : "false"}});

  std::string run_error;
  if (!services.runner.Run(executable, args, options, result, run_error)) {
    services.logger.Error("renderer invocation failed",
                          {{"exit_code", std::to_string(result.exit_code)}, {"error", run_error}});
    error.Set(BakeErrorKind::kExternalTool, std::move(run_error));
    return false;
  }
  return true;
}

bool RequireExistingPath(const std::string& path, std::string message, BakeError& error) {
  if (core::PathExists(path)) {
    return true;
  }
  error.Set(BakeErrorKind::kFileNotFound, std::move(message));
  return false;
}

bool WriteBakedManifest(const std::filesystem::path& manifest_path, std::string_view text,
                        BakeError& error) {
  std::string write_error;
  if (!core::WriteTextFileAtomic(manifest_path, text, write_error)) {
    error.Set(BakeErrorKind::kExternalTool, std::move(write_error));
    return false;
  }
  return true;
}

bool PublishBakedManifest(EngineServices& services, const std::filesystem::path& manifest_path,
                          BakeError& error) {
  std::string output_error;
  if (!services.host.SetOutput(kManifestsBundleOutput, manifest_path.string(), output_error)) {
    error.Set(BakeErrorKind::kExternalTool,
              "failed to publish " + std::string(kManifestsBundleOutput) + ": " + output_error);
    return false;
  }
  services.logger.Info("manifest baked", {{"path", manifest_path.string()}});
  return true;
}

} // namespace kbake::render
