#include "render/bake_error.hpp"

namespace kbake::render {

std::string_view ToStableErrorCode(BakeErrorKind kind) {
  switch (kind) {
  case BakeErrorKind::kUnknownEngine:
    return "UNKNOWN_ENGINE";
  case BakeErrorKind::kMissingScratchDirectory:
    return "MISSING_SCRATCH_DIRECTORY";
  case BakeErrorKind::kRequiredInputMissing:
    return "REQUIRED_INPUT_MISSING";
  case BakeErrorKind::kFileNotFound:
    return "FILE_NOT_FOUND";
  case BakeErrorKind::kUnsupportedClientVersion:
    return "UNSUPPORTED_CLIENT_VERSION";
  case BakeErrorKind::kExternalTool:
    return "EXTERNAL_TOOL";
  }
  return "EXTERNAL_TOOL";
}

} // namespace kbake::render
