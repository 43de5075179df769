#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kbake::cli {

// Options for `kbake bake`. Inputs given here take precedence over the
// INPUT_* environment the pipeline host provides.
struct BakeOptions {
  std::vector<std::pair<std::string, std::string>> inputs;
  std::optional<std::filesystem::path> scratch_dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool log_level_explicit = false;
};

// Routes `kbake` subcommands and returns the process exit code:
//   0 => manifest baked (or informational command succeeded)
//   1 => bake failed; the failure was reported through the host
//   2 => usage error (unknown command / invalid args)
int Dispatch(int argc, char** argv);

} // namespace kbake::cli
