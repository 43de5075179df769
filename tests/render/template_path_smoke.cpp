#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include "render/template_path.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using kbake::render::BakeError;
using kbake::render::BakeErrorKind;
using kbake::render::TemplatePathProvider;
using kbake::tests::common::Fail;
using kbake::tests::common::ScopedEnv;

namespace {

void AssertUnder(const fs::path& path, const fs::path& dir) {
  if (path.parent_path() != dir) {
    Fail("expected " + path.string() + " to live directly under " + dir.string());
  }
  if (!path.is_absolute()) {
    Fail("expected absolute template path, got " + path.string());
  }
}

} // namespace

int main() {
  const fs::path scratch = kbake::tests::common::CreateUniqueTempDir("kbake-template-path");
  ScopedEnv runner_temp("RUNNER_TEMP", scratch.c_str());

  // Back-to-back calls on the real clock.
  {
    TemplatePathProvider provider;
    fs::path first;
    fs::path second;
    BakeError error;
    if (!provider.GetTemplatePath(first, error) || !provider.GetTemplatePath(second, error)) {
      Fail("GetTemplatePath failed with RUNNER_TEMP set: " + error.message);
    }
    if (first == second) {
      Fail("back-to-back template paths collided: " + first.string());
    }
    AssertUnder(first, scratch);
    AssertUnder(second, scratch);
    kbake::tests::common::AssertContains(first.filename().string(), "baked-template-");
    if (first.extension() != ".yaml") {
      Fail("expected .yaml extension, got " + first.string());
    }
  }

  // A frozen clock still yields distinct, increasing stamps.
  {
    TemplatePathProvider provider(std::nullopt, [] { return std::int64_t{1700000000000}; });
    fs::path a;
    fs::path b;
    fs::path c;
    BakeError error;
    if (!provider.GetTemplatePath(a, error) || !provider.GetTemplatePath(b, error) ||
        !provider.GetTemplatePath(c, error)) {
      Fail("GetTemplatePath failed on frozen clock: " + error.message);
    }
    kbake::tests::common::AssertEqual(a.filename().string(), "baked-template-1700000000000.yaml",
                                      "first stamp should be the clock value");
    kbake::tests::common::AssertEqual(b.filename().string(), "baked-template-1700000000001.yaml",
                                      "same-tick call should bump by one");
    kbake::tests::common::AssertEqual(c.filename().string(), "baked-template-1700000000002.yaml",
                                      "third same-tick call should bump again");
  }

  // Clock stepping backwards does not reuse a stamp.
  {
    std::int64_t now = 5000;
    TemplatePathProvider provider(scratch, [&now] { return now; });
    fs::path first;
    fs::path second;
    BakeError error;
    if (!provider.GetTemplatePath(first, error)) {
      Fail("GetTemplatePath failed: " + error.message);
    }
    now = 4000;
    if (!provider.GetTemplatePath(second, error)) {
      Fail("GetTemplatePath failed: " + error.message);
    }
    kbake::tests::common::AssertEqual(second.filename().string(), "baked-template-5001.yaml",
                                      "backwards clock should continue from the last stamp");
  }

  // Explicit override beats RUNNER_TEMP.
  {
    const fs::path other = scratch / "override";
    TemplatePathProvider provider(other, nullptr);
    fs::path path;
    BakeError error;
    if (!provider.GetTemplatePath(path, error)) {
      Fail("GetTemplatePath failed with override: " + error.message);
    }
    AssertUnder(path, other);
  }

  // No scratch directory at all.
  {
    ScopedEnv unset("RUNNER_TEMP", nullptr);
    TemplatePathProvider provider;
    fs::path path;
    BakeError error;
    if (provider.GetTemplatePath(path, error)) {
      Fail("expected failure without RUNNER_TEMP");
    }
    if (error.kind != BakeErrorKind::kMissingScratchDirectory) {
      Fail("expected kMissingScratchDirectory");
    }
    kbake::tests::common::AssertContains(error.message, "Unable to create temp directory.");
  }

  kbake::tests::common::RemovePathBestEffort(scratch);
  std::cout << "template_path_smoke: ok\n";
  return 0;
}
