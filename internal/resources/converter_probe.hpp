#pragma once

#include <optional>
#include <string>

#include "internal/util/deadline.hpp"
#include "internal/util/process.hpp"

namespace speechmaker::resources {

/*
  Locates the audio converter. Implementations must honour the deadline.
*/
class ConverterProbe {
 public:
  virtual ~ConverterProbe() = default;

  // Quick check of a bundled binary; avoids spawning a process.
  virtual bool CheckBundled(const std::string& path) = 0;

  // Finds and validates a system-wide converter. Empty when absent.
  virtual std::optional<std::string> FindSystem(const util::Deadline& deadline) = 0;
};

/*
  Filesystem and PATH based probe for ffmpeg.
*/
class SystemConverterProbe : public ConverterProbe {
 public:
  explicit SystemConverterProbe(std::string system_binary, util::ProcessRunner runner = {});

  bool CheckBundled(const std::string& path) override;

  std::optional<std::string> FindSystem(const util::Deadline& deadline) override;

 private:
  std::string         system_binary_;
  util::ProcessRunner runner_;
};

// Searches PATH (or takes `binary` as is when it contains a slash).
std::optional<std::string> FindExecutable(const std::string& binary);

// <directory of the running executable>/resources/ffmpeg/<platform>/<arch>/ffmpeg
std::string DefaultBundledConverterPath();

} // namespace speechmaker::resources
