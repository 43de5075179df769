#include "render/kustomize/version_gate.hpp"

#include "core/json_dom.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace kbake::render::kustomize {

namespace {

constexpr std::string_view kUnsupportedVersionMessage =
    "kubectl client version equal to v1.14 or higher is required to use kustomize features";

bool ReadComponent(const core::json::Value& client_version, std::string_view key, int& value,
                   std::string& error) {
  const core::json::Value* field = client_version.Find(key);
  if (field == nullptr) {
    error = "clientVersion." + std::string(key) + " is missing";
    return false;
  }

  if (field->type == core::json::Value::Type::kString) {
    if (!ParseVersionComponent(field->string_value, value)) {
      error = "clientVersion." + std::string(key) + " is not numeric: '" + field->string_value +
              "'";
      return false;
    }
    return true;
  }

  if (field->type == core::json::Value::Type::kNumber) {
    const double number = field->number_value;
    if (!std::isfinite(number) || number < 0.0 ||
        number > static_cast<double>(std::numeric_limits<int>::max())) {
      error = "clientVersion." + std::string(key) + " is out of range";
      return false;
    }
    value = static_cast<int>(number);
    return true;
  }

  error = "clientVersion." + std::string(key) + " must be a string or number";
  return false;
}

} // namespace

bool ParseVersionComponent(std::string_view text, int& value) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }

  const char* begin = text.data() + pos;
  const char* end = text.data() + text.size();
  int parsed = 0;
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr == begin) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseKubectlClientVersion(std::string_view json_text, VersionInfo& version,
                               std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }

  const core::json::Value* client_version = root.Find("clientVersion");
  if (client_version == nullptr || !client_version->IsObject()) {
    error = "clientVersion object is missing";
    return false;
  }

  VersionInfo parsed;
  if (!ReadComponent(*client_version, "major", parsed.major, error) ||
      !ReadComponent(*client_version, "minor", parsed.minor, error)) {
    return false;
  }
  version = parsed;
  return true;
}

bool MeetsKustomizeVersionFloor(const VersionInfo& version) {
  if (version.major != kMinimumKubectlMajor) {
    return version.major > kMinimumKubectlMajor;
  }
  return version.minor >= kMinimumKubectlMinor;
}

bool CheckKustomizeClientVersion(std::string_view version_stdout, BakeError& error) {
  if (version_stdout.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    return true;
  }

  VersionInfo version;
  std::string parse_error;
  if (!ParseKubectlClientVersion(version_stdout, version, parse_error)) {
    error.Set(BakeErrorKind::kUnsupportedClientVersion,
              std::string(kUnsupportedVersionMessage) + " (" + parse_error + ")");
    return false;
  }

  if (!MeetsKustomizeVersionFloor(version)) {
    error.Set(BakeErrorKind::kUnsupportedClientVersion,
              std::string(kUnsupportedVersionMessage) + " (found v" +
                  std::to_string(version.major) + "." + std::to_string(version.minor) + ")");
    return false;
  }
  return true;
}

} // namespace kbake::render::kustomize
