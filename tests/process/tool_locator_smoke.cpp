#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include "process/tool_locator.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using kbake::process::FindExecutableOnSearchPath;
using kbake::process::SystemToolLocator;
using kbake::process::ToolOverrideVariable;
using kbake::tests::common::AssertContains;
using kbake::tests::common::AssertEqual;
using kbake::tests::common::Fail;
using kbake::tests::common::ScopedEnv;

int main() {
  const fs::path scratch = kbake::tests::common::CreateUniqueTempDir("kbake-tool-locator");
  const fs::path bin_a = scratch / "bin-a";
  const fs::path bin_b = scratch / "bin-b";
  fs::create_directories(bin_a);
  fs::create_directories(bin_b);

  kbake::tests::common::WriteExecutableScript(bin_b / "helm", "echo helm-b\n");
  // Present but not executable: must be skipped.
  kbake::tests::common::WriteFileOrFail(bin_a / "helm", "not a program\n");

  AssertEqual(ToolOverrideVariable("helm"), "KBAKE_HELM_PATH", "helm override variable");
  AssertEqual(ToolOverrideVariable("kubectl"), "KBAKE_KUBECTL_PATH", "kubectl override variable");

  const std::string search_path = bin_a.string() + ":" + bin_b.string();
  std::string found;
  if (!FindExecutableOnSearchPath("helm", search_path, found)) {
    Fail("expected helm to be found on the search path");
  }
  AssertEqual(found, (bin_b / "helm").string(), "first executable match");
  if (FindExecutableOnSearchPath("kompose", search_path, found)) {
    Fail("kompose should not be found");
  }

  // PATH lookup.
  {
    ScopedEnv path("PATH", search_path.c_str());
    ScopedEnv helm_override("KBAKE_HELM_PATH", nullptr);
    SystemToolLocator locator;
    std::string resolved;
    std::string error;
    if (!locator.Resolve("helm", resolved, error)) {
      Fail("PATH resolution failed: " + error);
    }
    AssertEqual(resolved, (bin_b / "helm").string(), "PATH resolution");

    if (locator.Resolve("kompose", resolved, error)) {
      Fail("kompose should not resolve");
    }
    AssertContains(error, "unable to locate 'kompose' on PATH");
    AssertContains(error, "KBAKE_KOMPOSE_PATH");
  }

  // Environment override wins over PATH.
  {
    const fs::path pinned = scratch / "pinned-helm";
    kbake::tests::common::WriteExecutableScript(pinned, "echo pinned\n");
    ScopedEnv path("PATH", search_path.c_str());
    ScopedEnv helm_override("KBAKE_HELM_PATH", pinned.c_str());
    SystemToolLocator locator;
    std::string resolved;
    std::string error;
    if (!locator.Resolve("helm", resolved, error)) {
      Fail("override resolution failed: " + error);
    }
    AssertEqual(resolved, pinned.string(), "env override resolution");
  }

  // Environment override pointing nowhere is an error, not a fallback.
  {
    const std::string missing = (scratch / "missing-helm").string();
    ScopedEnv path("PATH", search_path.c_str());
    ScopedEnv helm_override("KBAKE_HELM_PATH", missing.c_str());
    SystemToolLocator locator;
    std::string resolved;
    std::string error;
    if (locator.Resolve("helm", resolved, error)) {
      Fail("expected a dangling override to fail");
    }
    AssertContains(error, "KBAKE_HELM_PATH points at missing path " + missing);
  }

  // Programmatic override beats the environment.
  {
    const fs::path programmatic = scratch / "programmatic-kubectl";
    kbake::tests::common::WriteExecutableScript(programmatic, "echo kubectl\n");
    ScopedEnv kubectl_override("KBAKE_KUBECTL_PATH", (scratch / "elsewhere").c_str());
    SystemToolLocator locator;
    locator.SetOverride("kubectl", programmatic.string());
    std::string resolved;
    std::string error;
    if (!locator.Resolve("kubectl", resolved, error)) {
      Fail("programmatic override failed: " + error);
    }
    AssertEqual(resolved, programmatic.string(), "programmatic override");
  }

  kbake::tests::common::RemovePathBestEffort(scratch);
  std::cout << "tool_locator_smoke: ok\n";
  return 0;
}
