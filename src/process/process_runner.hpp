#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace kbake::process {

struct ProcessOptions {
  // Suppresses the `[command]` echo and the live stdout stream. Captured
  // output is returned either way.
  bool silent = false;
};

struct ProcessResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
};

// Runs one external program to completion.
//
// Contract:
// - returns true only when the program was spawned and exited with status 0
// - on false, `error` names the executable and the failure; `result` still
//   carries whatever the program wrote before failing
// - blocks until the child exits; there is no timeout
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  virtual bool Run(const std::string& executable, const std::vector<std::string>& args,
                   const ProcessOptions& options, ProcessResult& result, std::string& error) = 0;
};

// Human-readable command line for logs: `<exe> <arg> "<arg with space>"`.
std::string FormatCommandLine(const std::string& executable, const std::vector<std::string>& args);

// fork/exec implementation with both streams piped and drained via poll().
class PosixProcessRunner final : public IProcessRunner {
public:
  explicit PosixProcessRunner(std::ostream& echo = std::cout) : echo_(&echo) {}

  bool Run(const std::string& executable, const std::vector<std::string>& args,
           const ProcessOptions& options, ProcessResult& result, std::string& error) override;

private:
  std::ostream* echo_ = &std::cout;
};

} // namespace kbake::process
