#pragma once

#include "render/bake_error.hpp"

#include <filesystem>
#include <string_view>

namespace kbake::core::logging {
class Logger;
}

namespace kbake::host {
class IActionHost;
}

namespace kbake::process {
class IProcessRunner;
class IToolLocator;
} // namespace kbake::process

namespace kbake::render {

class TemplatePathProvider;

enum class EngineKind {
  kHelm,
  kKompose,
  kKustomize,
};

// Configuration tag for each engine: "helm2", "kompose", "kustomize".
std::string_view ToString(EngineKind kind);

// Output name downstream steps read the manifest path from.
inline constexpr std::string_view kManifestsBundleOutput = "manifestsBundle";

// Collaborators shared by every engine. Engines borrow them for the duration
// of one bake; the caller owns all of them.
struct EngineServices {
  host::IActionHost& host;
  process::IProcessRunner& runner;
  process::IToolLocator& tools;
  TemplatePathProvider& template_paths;
  core::logging::Logger& logger;
};

// One render backend.
//
// Contract:
// - Bake() reads only the inputs that belong to this engine
// - on success the manifest exists at `manifest_path` and has been published
//   as the `manifestsBundle` output
// - on failure nothing is published; `error` carries the kind and message
class IRenderEngine {
public:
  virtual ~IRenderEngine() = default;

  virtual EngineKind Kind() const = 0;

  virtual bool Bake(std::filesystem::path& manifest_path, BakeError& error) = 0;
};

} // namespace kbake::render
