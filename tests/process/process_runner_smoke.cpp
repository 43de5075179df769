#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include "process/process_runner.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

using kbake::process::FormatCommandLine;
using kbake::process::PosixProcessRunner;
using kbake::process::ProcessOptions;
using kbake::process::ProcessResult;
using kbake::tests::common::AssertContains;
using kbake::tests::common::AssertEqual;
using kbake::tests::common::AssertNotContains;
using kbake::tests::common::Fail;

int main() {
  const fs::path scratch = kbake::tests::common::CreateUniqueTempDir("kbake-process-runner");

  const fs::path echo_script = scratch / "echo_both.sh";
  kbake::tests::common::WriteExecutableScript(echo_script,
                                              "printf 'out:%s\\n' \"$1\"\n"
                                              "printf 'err:%s\\n' \"$2\" >&2\n");

  // Silent run: captured but not echoed.
  {
    std::ostringstream echo;
    PosixProcessRunner runner(echo);
    ProcessResult result;
    std::string error;
    ProcessOptions options;
    options.silent = true;
    if (!runner.Run(echo_script.string(), {"first arg", "second"}, options, result, error)) {
      Fail("silent run failed: " + error);
    }
    AssertEqual(result.stdout_text, "out:first arg\n", "captured stdout");
    AssertEqual(result.stderr_text, "err:second\n", "captured stderr");
    if (result.exit_code != 0) {
      Fail("expected exit code 0");
    }
    if (!echo.str().empty()) {
      Fail("silent run must not echo anything, got: " + echo.str());
    }
  }

  // Non-silent run: command line plus stdout are echoed; stderr is not.
  {
    std::ostringstream echo;
    PosixProcessRunner runner(echo);
    ProcessResult result;
    std::string error;
    if (!runner.Run(echo_script.string(), {"a", "b"}, ProcessOptions{}, result, error)) {
      Fail("echo run failed: " + error);
    }
    AssertContains(echo.str(), "[command]" + echo_script.string() + " a b\n");
    AssertContains(echo.str(), "out:a\n");
    AssertNotContains(echo.str(), "err:b");
  }

  // Non-zero exit reports the status and the stderr text.
  {
    const fs::path failing = scratch / "fail.sh";
    kbake::tests::common::WriteExecutableScript(failing,
                                                "echo partial\n"
                                                "echo 'Error: chart not found' >&2\n"
                                                "exit 3\n");
    std::ostringstream echo;
    PosixProcessRunner runner(echo);
    ProcessResult result;
    std::string error;
    ProcessOptions options;
    options.silent = true;
    if (runner.Run(failing.string(), {}, options, result, error)) {
      Fail("expected non-zero exit to fail");
    }
    if (result.exit_code != 3) {
      Fail("expected exit code 3, got " + std::to_string(result.exit_code));
    }
    AssertEqual(result.stdout_text, "partial\n", "stdout captured before failure");
    AssertContains(error, "failed with exit code 3");
    AssertContains(error, "Error: chart not found");
  }

  // Missing executable.
  {
    std::ostringstream echo;
    PosixProcessRunner runner(echo);
    ProcessResult result;
    std::string error;
    ProcessOptions options;
    options.silent = true;
    const std::string missing = (scratch / "no-such-tool").string();
    if (runner.Run(missing, {"template"}, options, result, error)) {
      Fail("expected missing executable to fail");
    }
    AssertContains(error, "unable to execute '" + missing + "'");
  }

  AssertEqual(FormatCommandLine("/usr/bin/helm", {"template", "./my chart", "--set", "a=b"}),
              "/usr/bin/helm template \"./my chart\" --set a=b", "formatted command line");

  kbake::tests::common::RemovePathBestEffort(scratch);
  std::cout << "process_runner_smoke: ok\n";
  return 0;
}
