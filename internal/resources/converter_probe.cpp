#include "converter_probe.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <system_error>

#include "internal/audio/ffmpeg_converter.hpp"

namespace speechmaker::resources {

namespace {

bool IsExecutableFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

constexpr std::string_view Platform() {
#if defined(__APPLE__)
  return "darwin";
#elif defined(_WIN32)
  return "win32";
#else
  return "linux";
#endif
}

constexpr std::string_view Arch() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
  return "ia32";
#else
  return "unknown";
#endif
}

} // namespace

std::optional<std::string> FindExecutable(const std::string& binary) {
  if (binary.empty()) {
    return std::nullopt;
  }
  if (binary.find('/') != std::string::npos) {
    return IsExecutableFile(binary) ? std::optional<std::string>(binary) : std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }

  std::string_view path(path_env);
  while (!path.empty()) {
    const auto sep = path.find(':');
    const auto dir = path.substr(0, sep);
    if (!dir.empty()) {
      const auto candidate = std::filesystem::path(std::string(dir)) / binary;
      if (IsExecutableFile(candidate)) {
        return candidate.string();
      }
    }
    if (sep == std::string_view::npos) {
      break;
    }
    path.remove_prefix(sep + 1);
  }
  return std::nullopt;
}

std::string DefaultBundledConverterPath() {
  std::error_code ec;
  const auto      exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  const auto      dir = ec ? std::filesystem::current_path(ec) : exe.parent_path();
  return (dir / "resources" / "ffmpeg" / std::string(Platform()) / std::string(Arch()) / "ffmpeg").string();
}

SystemConverterProbe::SystemConverterProbe(std::string system_binary, util::ProcessRunner runner)
    : system_binary_(std::move(system_binary)), runner_(runner) {
}

bool SystemConverterProbe::CheckBundled(const std::string& path) {
  return !path.empty() && IsExecutableFile(path);
}

std::optional<std::string> SystemConverterProbe::FindSystem(const util::Deadline& deadline) {
  auto found = FindExecutable(system_binary_);
  if (!found) {
    return std::nullopt;
  }
  if (!audio::FfmpegConverter::Validate(*found, deadline, runner_)) {
    return std::nullopt;
  }
  return found;
}

} // namespace speechmaker::resources
