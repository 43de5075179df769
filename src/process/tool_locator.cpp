#include "process/tool_locator.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace fs = std::filesystem;

namespace kbake::process {

namespace {

bool IsExecutableFile(const fs::path& candidate) {
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec) || ec) {
    return false;
  }
  return ::access(candidate.c_str(), X_OK) == 0;
}

bool ResolveExplicitPath(std::string_view tool, const std::string& configured,
                         std::string_view source, std::string& executable_path,
                         std::string& error) {
  std::error_code ec;
  if (!fs::exists(configured, ec) || ec) {
    error = "unable to locate '" + std::string(tool) + "': " + std::string(source) +
            " points at missing path " + configured;
    return false;
  }
  executable_path = fs::absolute(configured, ec).string();
  if (ec) {
    executable_path = configured;
  }
  return true;
}

} // namespace

std::string ToolOverrideVariable(std::string_view tool) {
  std::string name = "KBAKE_";
  for (const char c : tool) {
    name.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  name += "_PATH";
  return name;
}

bool FindExecutableOnSearchPath(std::string_view tool, std::string_view search_path,
                                std::string& executable_path) {
  std::size_t begin = 0;
  while (begin <= search_path.size()) {
    std::size_t end = search_path.find(':', begin);
    if (end == std::string_view::npos) {
      end = search_path.size();
    }
    // An empty PATH entry means the current directory.
    const std::string_view entry = search_path.substr(begin, end - begin);
    const fs::path candidate = fs::path(entry.empty() ? "." : std::string(entry)) / std::string(tool);
    if (IsExecutableFile(candidate)) {
      executable_path = candidate.string();
      return true;
    }
    begin = end + 1;
  }
  return false;
}

void SystemToolLocator::SetOverride(std::string_view tool, std::string path) {
  overrides_[std::string(tool)] = std::move(path);
}

bool SystemToolLocator::Resolve(std::string_view tool, std::string& executable_path,
                                std::string& error) {
  executable_path.clear();
  error.clear();

  if (tool.empty()) {
    error = "tool name cannot be empty";
    return false;
  }

  const auto override_it = overrides_.find(tool);
  if (override_it != overrides_.end()) {
    return ResolveExplicitPath(tool, override_it->second, "override", executable_path, error);
  }

  const std::string variable = ToolOverrideVariable(tool);
  const char* configured = std::getenv(variable.c_str());
  if (configured != nullptr && *configured != '\0') {
    return ResolveExplicitPath(tool, configured, variable, executable_path, error);
  }

  const char* search_path = std::getenv("PATH");
  if (search_path != nullptr &&
      FindExecutableOnSearchPath(tool, search_path, executable_path)) {
    return true;
  }

  error = "unable to locate '" + std::string(tool) + "' on PATH; install it or set " + variable;
  return false;
}

} // namespace kbake::process
