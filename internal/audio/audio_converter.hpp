#pragma once

#include <string>
#include <vector>

#include "internal/model/output_format.hpp"
#include "internal/util/deadline.hpp"

namespace speechmaker::audio {

/*
  External audio conversion tool. Optional: absence only disables MP3 output.

  Failures raise util::OperationError; messages start with
  "MP3 conversion failed" or "Audio merging failed".
*/
class AudioConverter {
 public:
  virtual ~AudioConverter() = default;

  virtual void Transcode(const std::string& input, const std::string& output, model::OutputFormat format,
                         const util::CancellationToken& cancel) = 0;

  // Concatenates `inputs` in the given order.
  virtual void Merge(const std::vector<std::string>& inputs, const std::string& output, model::OutputFormat format,
                     const util::CancellationToken& cancel) = 0;
};

} // namespace speechmaker::audio
