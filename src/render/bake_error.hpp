#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace kbake::render {

// Failure classes a bake can end in. Every kind is terminal; nothing in the
// render path retries.
enum class BakeErrorKind {
  kUnknownEngine,
  kMissingScratchDirectory,
  kRequiredInputMissing,
  kFileNotFound,
  kUnsupportedClientVersion,
  kExternalTool,
};

// Grep-friendly code for logs, e.g. "FILE_NOT_FOUND".
std::string_view ToStableErrorCode(BakeErrorKind kind);

struct BakeError {
  BakeErrorKind kind = BakeErrorKind::kExternalTool;
  std::string message;

  void Set(BakeErrorKind new_kind, std::string new_message) {
    kind = new_kind;
    message = std::move(new_message);
  }
};

} // namespace kbake::render
