#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace kbake::process {

// Resolves a renderer binary name (`helm`, `kompose`, `kubectl`) to a path
// that can be handed to IProcessRunner.
class IToolLocator {
public:
  virtual ~IToolLocator() = default;

  virtual bool Resolve(std::string_view tool, std::string& executable_path,
                       std::string& error) = 0;
};

// "helm" -> "KBAKE_HELM_PATH".
std::string ToolOverrideVariable(std::string_view tool);

// Searches a PATH-style list (':'-separated) for an executable regular file.
bool FindExecutableOnSearchPath(std::string_view tool, std::string_view search_path,
                                std::string& executable_path);

// Lookup order:
// 1. explicit override registered with SetOverride()
// 2. KBAKE_<TOOL>_PATH environment variable (must point at an existing file)
// 3. the PATH environment variable
class SystemToolLocator final : public IToolLocator {
public:
  void SetOverride(std::string_view tool, std::string path);

  bool Resolve(std::string_view tool, std::string& executable_path, std::string& error) override;

private:
  std::map<std::string, std::string, std::less<>> overrides_;
};

} // namespace kbake::process
