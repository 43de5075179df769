#include "host/action_host.hpp"

#include "core/fs_utils.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

namespace kbake::host {

namespace {

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::string NextOutputDelimiter() {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  return "ghadelimiter_" + std::to_string(tick) + "_" +
         std::to_string(counter.fetch_add(1U, std::memory_order_relaxed));
}

} // namespace

std::string EscapeCommandData(std::string_view data) {
  std::string escaped;
  escaped.reserve(data.size());
  for (const char c : data) {
    switch (c) {
    case '%':
      escaped += "%25";
      break;
    case '\r':
      escaped += "%0D";
      break;
    case '\n':
      escaped += "%0A";
      break;
    default:
      escaped.push_back(c);
      break;
    }
  }
  return escaped;
}

std::string EscapeCommandProperty(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char c : EscapeCommandData(value)) {
    if (c == ':') {
      escaped += "%3A";
    } else if (c == ',') {
      escaped += "%2C";
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

std::string InputEnvironmentName(std::string_view input_name) {
  std::string env_name = "INPUT_";
  env_name.reserve(env_name.size() + input_name.size());
  for (const char c : input_name) {
    env_name.push_back(c == ' ' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return env_name;
}

bool BuildOutputFileRecord(std::string_view name, std::string_view value,
                           std::string_view delimiter, std::string& record, std::string& error) {
  if (name.empty()) {
    error = "output name cannot be empty";
    return false;
  }
  if (name.find(delimiter) != std::string_view::npos) {
    error = "unexpected input: name should not contain the delimiter \"" +
            std::string(delimiter) + "\"";
    return false;
  }
  if (value.find(delimiter) != std::string_view::npos) {
    error = "unexpected input: value should not contain the delimiter \"" +
            std::string(delimiter) + "\"";
    return false;
  }

  record.clear();
  record.append(name).append("<<").append(delimiter).append("\n");
  record.append(value).append("\n");
  record.append(delimiter).append("\n");
  return true;
}

void EnvironmentActionHost::SetInputOverride(std::string_view name, std::string value) {
  input_overrides_[InputEnvironmentName(name)] = std::move(value);
}

bool EnvironmentActionHost::GetInput(std::string_view name, bool required, std::string& value,
                                     std::string& error) {
  value.clear();
  const std::string env_name = InputEnvironmentName(name);

  const auto override_it = input_overrides_.find(env_name);
  if (override_it != input_overrides_.end()) {
    value = Trim(override_it->second);
  } else if (const char* raw = std::getenv(env_name.c_str()); raw != nullptr) {
    value = Trim(raw);
  }

  if (required && value.empty()) {
    error = "Input required and not supplied: " + std::string(name);
    return false;
  }
  return true;
}

bool EnvironmentActionHost::SetOutput(std::string_view name, std::string_view value,
                                      std::string& error) {
  const char* output_file = std::getenv("GITHUB_OUTPUT");
  if (output_file != nullptr && *output_file != '\0') {
    std::string record;
    if (!BuildOutputFileRecord(name, value, NextOutputDelimiter(), record, error)) {
      return false;
    }
    return core::AppendTextFile(std::filesystem::path(output_file), record, error);
  }

  (*out_) << '\n'
          << "::set-output name=" << EscapeCommandProperty(name)
          << "::" << EscapeCommandData(value) << '\n';
  out_->flush();
  return true;
}

void EnvironmentActionHost::Info(std::string_view message) {
  (*out_) << message << '\n';
  out_->flush();
}

void EnvironmentActionHost::Debug(std::string_view message) {
  (*out_) << "::debug::" << EscapeCommandData(message) << '\n';
  out_->flush();
}

void EnvironmentActionHost::SetFailed(std::string_view message) {
  failed_ = true;
  (*out_) << "::error::" << EscapeCommandData(message) << '\n';
  out_->flush();
}

} // namespace kbake::host
