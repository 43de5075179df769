#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include "host/action_host.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using kbake::host::BuildOutputFileRecord;
using kbake::host::EnvironmentActionHost;
using kbake::host::EscapeCommandData;
using kbake::host::EscapeCommandProperty;
using kbake::host::InputEnvironmentName;
using kbake::tests::common::ScopedEnv;

TEST_CASE("input names map to INPUT_ environment variables", "[host]") {
  REQUIRE(InputEnvironmentName("helmChart") == "INPUT_HELMCHART");
  REQUIRE(InputEnvironmentName("override files") == "INPUT_OVERRIDE_FILES");
}

TEST_CASE("workflow command escaping", "[host]") {
  REQUIRE(EscapeCommandData("50%\r\nnext") == "50%25%0D%0Anext");
  REQUIRE(EscapeCommandProperty("a:b,c%") == "a%3Ab%2Cc%25");
}

TEST_CASE("output file record uses the heredoc delimiter", "[host]") {
  std::string record;
  std::string error;
  REQUIRE(BuildOutputFileRecord("manifestsBundle", "/tmp/x.yaml", "EOF_1", record, error));
  REQUIRE(record == "manifestsBundle<<EOF_1\n/tmp/x.yaml\nEOF_1\n");

  REQUIRE_FALSE(BuildOutputFileRecord("name", "contains EOF_1", "EOF_1", record, error));
  REQUIRE(error.find("value should not contain the delimiter") != std::string::npos);
  REQUIRE_FALSE(BuildOutputFileRecord("", "v", "EOF_1", record, error));
}

TEST_CASE("inputs are trimmed and overrides win over the environment", "[host]") {
  ScopedEnv chart("INPUT_HELMCHART", "  ./chart \n");
  ScopedEnv release("INPUT_RELEASENAME", "from-env");

  std::ostringstream out;
  EnvironmentActionHost host(out);
  host.SetInputOverride("releaseName", "from-cli");

  std::string value;
  std::string error;
  REQUIRE(host.GetInput("helmChart", true, value, error));
  REQUIRE(value == "./chart");
  REQUIRE(host.GetInput("releaseName", false, value, error));
  REQUIRE(value == "from-cli");
}

TEST_CASE("missing required input fails with the input name", "[host]") {
  ScopedEnv compose("INPUT_DOCKERCOMPOSEFILE", nullptr);
  ScopedEnv blank("INPUT_KUSTOMIZATIONPATH", "   ");

  std::ostringstream out;
  EnvironmentActionHost host(out);
  std::string value = "stale";
  std::string error;
  REQUIRE(host.GetInput("dockerComposeFile", false, value, error));
  REQUIRE(value.empty());

  REQUIRE_FALSE(host.GetInput("dockerComposeFile", true, value, error));
  REQUIRE(error == "Input required and not supplied: dockerComposeFile");
  REQUIRE_FALSE(host.GetInput("kustomizationPath", true, value, error));
}

TEST_CASE("outputs go to GITHUB_OUTPUT when configured", "[host]") {
  const auto root = kbake::tests::common::CreateUniqueTempDir("kbake-host-output");
  const auto output_file = root / "github_output";
  ScopedEnv github_output("GITHUB_OUTPUT", output_file.c_str());

  std::ostringstream out;
  EnvironmentActionHost host(out);
  std::string error;
  REQUIRE(host.SetOutput("manifestsBundle", "/tmp/baked-template-1.yaml", error));

  const std::string text = kbake::tests::common::ReadFileToString(output_file);
  REQUIRE(text.rfind("manifestsBundle<<ghadelimiter_", 0) == 0U);
  REQUIRE(text.find("\n/tmp/baked-template-1.yaml\nghadelimiter_") != std::string::npos);
  REQUIRE(out.str().empty());

  kbake::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("outputs fall back to set-output commands", "[host]") {
  ScopedEnv github_output("GITHUB_OUTPUT", nullptr);

  std::ostringstream out;
  EnvironmentActionHost host(out);
  std::string error;
  REQUIRE(host.SetOutput("manifestsBundle", "/tmp/a.yaml", error));
  host.Debug("Running helm template command..");
  REQUIRE_FALSE(host.Failed());
  host.SetFailed("Failed to run bake action. Error: boom\nmore");
  REQUIRE(host.Failed());

  const std::string text = out.str();
  REQUIRE(text.find("::set-output name=manifestsBundle::/tmp/a.yaml\n") != std::string::npos);
  REQUIRE(text.find("::debug::Running helm template command..\n") != std::string::npos);
  REQUIRE(text.find("::error::Failed to run bake action. Error: boom%0Amore\n") !=
          std::string::npos);
}
