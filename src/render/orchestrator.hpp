#pragma once

#include "render/bake_error.hpp"
#include "render/render_engine.hpp"

#include <filesystem>
#include <string>

namespace kbake::render {

struct BakeRunResult {
  bool succeeded = false;
  std::filesystem::path manifest_path;
  // Populated on failure; `failure_message` is exactly what was reported to
  // the host's failure channel.
  BakeError error;
  std::string failure_message;
};

// One bake action: read renderEngine, select the engine, bake once.
//
// Selection failures (missing or unknown renderEngine) are reported as-is.
// Bake failures are wrapped as "Failed to run bake action. Error: <message>".
// Either way the host is marked failed and no output is published.
bool RunBakeAction(EngineServices services, BakeRunResult& result);

} // namespace kbake::render
