#pragma once

#include "render/bake_error.hpp"

#include <string>
#include <string_view>

namespace kbake::render::kustomize {

struct VersionInfo {
  int major = 0;
  int minor = 0;
};

// `kubectl kustomize` first shipped in v1.14.
inline constexpr int kMinimumKubectlMajor = 1;
inline constexpr int kMinimumKubectlMinor = 14;

// Reads the leading integer of a version component the way kubectl reports
// it: "14" -> 14, "14+" -> 14 (GKE/EKS builds), " 7" -> 7. Fails when no digit
// leads the text.
bool ParseVersionComponent(std::string_view text, int& value);

// Extracts clientVersion.major / clientVersion.minor from the JSON printed by
// `kubectl version --client=true -o json`. Components may be JSON strings or
// numbers.
bool ParseKubectlClientVersion(std::string_view json_text, VersionInfo& version,
                               std::string& error);

// True for any version at or above v1.14, including later majors.
bool MeetsKustomizeVersionFloor(const VersionInfo& version);

// Gate applied before `kubectl kustomize`. Empty output skips the check;
// unreadable or too-old versions fail with kUnsupportedClientVersion.
bool CheckKustomizeClientVersion(std::string_view version_stdout, BakeError& error);

} // namespace kbake::render::kustomize
