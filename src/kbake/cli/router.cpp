#include "kbake/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "host/action_host.hpp"
#include "process/process_runner.hpp"
#include "process/tool_locator.hpp"
#include "render/engine_selector.hpp"
#include "render/orchestrator.hpp"
#include "render/render_engine.hpp"
#include "render/template_path.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace kbake::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  kbake bake [--input <name>=<value>]... [--scratch-dir <dir>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  kbake version\n"
      << "\n"
      << "inputs (also read from INPUT_<NAME> environment variables):\n"
      << "  renderEngine       ";
  bool first = true;
  for (const std::string_view name : render::SupportedEngineNames()) {
    out << (first ? "" : " | ") << name;
    first = false;
  }
  out << "\n"
      << "  helmChart, releaseName, overrideFiles, overrides   (helm2)\n"
      << "  dockerComposeFile                                  (kompose)\n"
      << "  kustomizationPath                                  (kustomize)\n";
}

// `--input name=value`: split on the first '=', so values may contain '='.
bool ParseInputAssignment(std::string_view token, std::pair<std::string, std::string>& input,
                          std::string& error) {
  const std::size_t equals = token.find('=');
  if (equals == std::string_view::npos || equals == 0U) {
    error = "--input expects <name>=<value>, got '" + std::string(token) + "'";
    return false;
  }
  input.first = std::string(token.substr(0, equals));
  input.second = std::string(token.substr(equals + 1));
  return true;
}

bool ParseBakeOptions(const std::vector<std::string_view>& args, BakeOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool has_value = i + 1 < args.size();

    if (token == "--input") {
      if (!has_value) {
        error = "missing value for --input";
        return false;
      }
      std::pair<std::string, std::string> input;
      if (!ParseInputAssignment(args[++i], input, error)) {
        return false;
      }
      options.inputs.push_back(std::move(input));
      continue;
    }

    if (token == "--scratch-dir") {
      if (!has_value || args[i + 1].empty()) {
        error = "missing value for --scratch-dir";
        return false;
      }
      options.scratch_dir = std::filesystem::path(std::string(args[++i]));
      continue;
    }

    if (token == "--log-level") {
      const std::string_view raw = has_value ? args[++i] : std::string_view{};
      if (!core::logging::ParseLogLevel(raw, options.log_level, error)) {
        return false;
      }
      options.log_level_explicit = true;
      continue;
    }

    error = "unknown argument for bake: " + std::string(token);
    return false;
  }
  return true;
}

// RUNNER_DEBUG=1 is how the pipeline host asks for step debug logging.
core::logging::LogLevel EffectiveLogLevel(const BakeOptions& options) {
  if (options.log_level_explicit) {
    return options.log_level;
  }
  const char* runner_debug = std::getenv("RUNNER_DEBUG");
  if (runner_debug != nullptr && std::string_view(runner_debug) == "1") {
    return core::logging::LogLevel::kDebug;
  }
  return options.log_level;
}

int CommandBake(const std::vector<std::string_view>& args) {
  BakeOptions options;
  std::string error;
  if (!ParseBakeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(EffectiveLogLevel(options));
  host::EnvironmentActionHost action_host(std::cout);
  for (const auto& [name, value] : options.inputs) {
    action_host.SetInputOverride(name, value);
  }
  process::PosixProcessRunner runner(std::cout);
  process::SystemToolLocator tools;
  render::TemplatePathProvider template_paths(options.scratch_dir, nullptr);

  logger.Debug("bake requested",
               {{"input_overrides", std::to_string(options.inputs.size())},
                {"scratch_dir", options.scratch_dir ? options.scratch_dir->string() : "RUNNER_TEMP"}});

  render::EngineServices services{action_host, runner, tools, template_paths, logger};
  render::BakeRunResult result;
  if (!render::RunBakeAction(services, result)) {
    return kExitFailure;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "kbake 0.1.0\n";
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "bake") {
    return CommandBake(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace kbake::cli
