#include "render/template_path.hpp"

#include "core/time_utils.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace kbake::render {

TemplatePathProvider::TemplatePathProvider()
    : TemplatePathProvider(std::nullopt, &core::EpochMillisNow) {}

TemplatePathProvider::TemplatePathProvider(std::optional<fs::path> scratch_dir_override,
                                           MillisClock clock)
    : scratch_dir_override_(std::move(scratch_dir_override)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = &core::EpochMillisNow;
  }
}

bool TemplatePathProvider::ResolveScratchDirectory(fs::path& scratch_dir, BakeError& error) const {
  if (scratch_dir_override_.has_value() && !scratch_dir_override_->empty()) {
    scratch_dir = *scratch_dir_override_;
  } else {
    const char* runner_temp = std::getenv("RUNNER_TEMP");
    if (runner_temp == nullptr || *runner_temp == '\0') {
      error.Set(BakeErrorKind::kMissingScratchDirectory, "Unable to create temp directory.");
      return false;
    }
    scratch_dir = runner_temp;
  }

  std::error_code ec;
  const fs::path absolute = fs::absolute(scratch_dir, ec);
  if (!ec) {
    scratch_dir = absolute.lexically_normal();
  }
  return true;
}

bool TemplatePathProvider::GetTemplatePath(fs::path& path, BakeError& error) {
  fs::path scratch_dir;
  if (!ResolveScratchDirectory(scratch_dir, error)) {
    return false;
  }

  std::int64_t stamp = clock_();
  if (stamp <= last_stamp_) {
    stamp = last_stamp_ + 1;
  }
  last_stamp_ = stamp;

  path = scratch_dir / ("baked-template-" + std::to_string(stamp) + ".yaml");
  return true;
}

} // namespace kbake::render
