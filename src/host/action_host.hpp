#pragma once

#include <iostream>
#include <map>
#include <string>
#include <string_view>

namespace kbake::host {

// Pipeline-host contract consumed by the render engines.
//
// The render path only needs four things from the host that runs it: named
// inputs, a place to publish the output artifact, a log channel and a way to
// mark the step as failed. Keeping these behind one interface lets engine tests
// run against an in-memory host.
class IActionHost {
public:
  virtual ~IActionHost() = default;

  // Reads input `name`. A required input that is missing or blank fails with
  // "Input required and not supplied: <name>". Optional inputs resolve to "".
  virtual bool GetInput(std::string_view name, bool required, std::string& value,
                        std::string& error) = 0;

  // Publishes one named output for downstream steps.
  virtual bool SetOutput(std::string_view name, std::string_view value, std::string& error) = 0;

  // Plain progress line visible in the step log.
  virtual void Info(std::string_view message) = 0;

  // Diagnostic line; the host decides whether to show it.
  virtual void Debug(std::string_view message) = 0;

  // Records the step's terminal failure message.
  virtual void SetFailed(std::string_view message) = 0;

  virtual bool Failed() const = 0;
};

// Workflow-command escaping for message data (`::debug::<data>`).
std::string EscapeCommandData(std::string_view data);

// Workflow-command escaping for property values (`name=<value>`).
std::string EscapeCommandProperty(std::string_view value);

// "override files" -> "INPUT_OVERRIDE_FILES".
std::string InputEnvironmentName(std::string_view input_name);

// Builds one `name<<delimiter` record for the GITHUB_OUTPUT file. Fails when
// the delimiter collides with the name or value.
bool BuildOutputFileRecord(std::string_view name, std::string_view value,
                           std::string_view delimiter, std::string& record, std::string& error);

// Host adapter for GitHub-Actions-compatible runners.
//
// Inputs come from `INPUT_<NAME>` environment variables unless an explicit
// override was registered (CLI `--input`). Outputs go to the file named by
// `GITHUB_OUTPUT` when set, or to a `::set-output` command otherwise.
class EnvironmentActionHost final : public IActionHost {
public:
  explicit EnvironmentActionHost(std::ostream& out = std::cout) : out_(&out) {}

  // Overrides win over the environment for the same input name.
  void SetInputOverride(std::string_view name, std::string value);

  bool GetInput(std::string_view name, bool required, std::string& value,
                std::string& error) override;
  bool SetOutput(std::string_view name, std::string_view value, std::string& error) override;
  void Info(std::string_view message) override;
  void Debug(std::string_view message) override;
  void SetFailed(std::string_view message) override;

  bool Failed() const override {
    return failed_;
  }

private:
  std::ostream* out_ = &std::cout;
  std::map<std::string, std::string> input_overrides_;
  bool failed_ = false;
};

} // namespace kbake::host
