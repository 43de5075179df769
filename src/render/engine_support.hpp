#pragma once

#include "process/process_runner.hpp"
#include "render/bake_error.hpp"
#include "render/render_engine.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kbake::render {

// Steps every engine composes into its Bake(). Each maps collaborator
// failures onto the matching BakeErrorKind.

bool ReadEngineInput(EngineServices& services, std::string_view name, bool required,
                     std::string& value, BakeError& error);

bool ResolveEngineTool(EngineServices& services, std::string_view tool,
                       std::string& executable_path, BakeError& error);

bool RunEngineTool(EngineServices& services, const std::string& executable,
                   const std::vector<std::string>& args, const process::ProcessOptions& options,
                   process::ProcessResult& result, BakeError& error);

// Fails with kFileNotFound and `message` when `path` does not exist.
bool RequireExistingPath(const std::string& path, std::string message, BakeError& error);

bool WriteBakedManifest(const std::filesystem::path& manifest_path, std::string_view text,
                        BakeError& error);

// Publishes `manifest_path` as the manifestsBundle output.
bool PublishBakedManifest(EngineServices& services, const std::filesystem::path& manifest_path,
                          BakeError& error);

} // namespace kbake::render
