#pragma once

#include <optional>
#include <string_view>

namespace speechmaker::model {

enum class OutputFormat {
  kWav,
  kMp3,
};

constexpr std::string_view Extension(OutputFormat format) {
  return format == OutputFormat::kMp3 ? "mp3" : "wav";
}

constexpr std::optional<OutputFormat> ParseOutputFormat(std::string_view value) {
  if (value == "wav") {
    return OutputFormat::kWav;
  }
  if (value == "mp3") {
    return OutputFormat::kMp3;
  }
  return std::nullopt;
}

} // namespace speechmaker::model
