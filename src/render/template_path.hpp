#pragma once

#include "render/bake_error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace kbake::render {

// Allocates `<scratch>/baked-template-<millis>.yaml` paths.
//
// The scratch directory is the explicit override when one was given, else
// the RUNNER_TEMP environment variable at call time. Stamps issued by one
// provider strictly increase: a call in the same millisecond as the previous
// one (or after a clock step backwards) gets previous + 1.
class TemplatePathProvider {
public:
  using MillisClock = std::function<std::int64_t()>;

  TemplatePathProvider();
  TemplatePathProvider(std::optional<std::filesystem::path> scratch_dir_override,
                       MillisClock clock);

  bool GetTemplatePath(std::filesystem::path& path, BakeError& error);

private:
  bool ResolveScratchDirectory(std::filesystem::path& scratch_dir, BakeError& error) const;

  std::optional<std::filesystem::path> scratch_dir_override_;
  MillisClock clock_;
  std::int64_t last_stamp_ = std::numeric_limits<std::int64_t>::min();
};

} // namespace kbake::render
