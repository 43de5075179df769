#include "render/helm/helm_engine.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using kbake::render::helm::BuildHelmTemplateArgs;
using kbake::render::helm::HelmTemplateConfig;
using kbake::render::helm::OverridePair;
using kbake::render::helm::ParseOverridePair;
using kbake::render::helm::SplitInputLines;

TEST_CASE("override tokens split on the first colon only", "[render][helm]") {
  const OverridePair image = ParseOverridePair("image.tag:v1.2.3");
  REQUIRE(image.name == "image.tag");
  REQUIRE(image.value == "v1.2.3");

  const OverridePair replicas = ParseOverridePair("replicaCount:3");
  REQUIRE(replicas.name == "replicaCount");
  REQUIRE(replicas.value == "3");

  const OverridePair url = ParseOverridePair("ingress.url:https://example.com:8443/app");
  REQUIRE(url.name == "ingress.url");
  REQUIRE(url.value == "https://example.com:8443/app");
}

TEST_CASE("override token without a colon has an empty value", "[render][helm]") {
  const OverridePair flag = ParseOverridePair("debug");
  REQUIRE(flag.name == "debug");
  REQUIRE(flag.value.empty());

  const OverridePair empty_value = ParseOverridePair("key:");
  REQUIRE(empty_value.name == "key");
  REQUIRE(empty_value.value.empty());
}

TEST_CASE("multi-line inputs keep order and drop blank lines", "[render][helm]") {
  REQUIRE(SplitInputLines("a.yaml\nb.yaml") == std::vector<std::string>{"a.yaml", "b.yaml"});
  REQUIRE(SplitInputLines("a.yaml\r\n\r\nb.yaml\n") ==
          std::vector<std::string>{"a.yaml", "b.yaml"});
  REQUIRE(SplitInputLines("").empty());
}

TEST_CASE("chart only yields template and chart path", "[render][helm]") {
  HelmTemplateConfig config;
  config.chart_path = "./chart";
  REQUIRE(BuildHelmTemplateArgs(config) == std::vector<std::string>{"template", "./chart"});
}

TEST_CASE("helm arguments follow the fixed order", "[render][helm]") {
  HelmTemplateConfig config;
  config.chart_path = "charts/web";
  config.release_name = "web-canary";
  config.override_files = {"values-prod.yaml", "values-canary.yaml"};
  config.overrides = {ParseOverridePair("image.tag:v1.2.3"), ParseOverridePair("replicaCount:3")};

  const std::vector<std::string> expected = {
      "template",      "charts/web",
      "--name",        "web-canary",
      "-f",            "values-prod.yaml",
      "-f",            "values-canary.yaml",
      "--set",         "image.tag=v1.2.3",
      "--set",         "replicaCount=3",
  };
  REQUIRE(BuildHelmTemplateArgs(config) == expected);
}

TEST_CASE("overrides without release name or files", "[render][helm]") {
  HelmTemplateConfig config;
  config.chart_path = "./chart";
  config.overrides = {ParseOverridePair("key:val")};
  REQUIRE(BuildHelmTemplateArgs(config) ==
          std::vector<std::string>{"template", "./chart", "--set", "key=val"});
}
