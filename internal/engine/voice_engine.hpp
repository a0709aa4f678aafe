#pragma once

#include <string>
#include <vector>

#include "internal/model/output_format.hpp"
#include "internal/model/voice.hpp"
#include "internal/util/deadline.hpp"

namespace speechmaker::engine {

struct SynthesisRequest {
  std::string text;
  std::string voice_id;
  double      speed = 1.0;
  std::string output_path;
};

/*
  External speech synthesis engine.

  Implementations raise util::OperationError with an OS-style code on failure
  (ENOENT when the engine is missing, ETIMEDOUT, ECANCELED, EXIT_NONZERO).
*/
class VoiceEngine {
 public:
  virtual ~VoiceEngine() = default;

  virtual std::vector<model::Voice> ListVoices(const util::Deadline& deadline, const util::CancellationToken& cancel) = 0;

  // Container Synthesize() writes; anything else needs the audio converter.
  virtual model::OutputFormat NativeFormat() const = 0;

  // Writes NativeFormat() audio to request.output_path.
  virtual void Synthesize(const SynthesisRequest& request, const util::Deadline& deadline,
                          const util::CancellationToken& cancel) = 0;
};

} // namespace speechmaker::engine
