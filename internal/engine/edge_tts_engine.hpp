#pragma once

#include <string>
#include <vector>

#include "internal/engine/voice_engine.hpp"
#include "internal/util/process.hpp"

namespace speechmaker::engine {

/*
  VoiceEngine backed by the edge-tts command line tool.

    <binary> --list-voices
    <binary> --voice V --rate +N% --text T --write-media OUT

  --write-media always produces MP3, whatever the file extension.
*/
class EdgeTtsEngine : public VoiceEngine {
 public:
  explicit EdgeTtsEngine(std::string binary, util::ProcessRunner runner = {});

  std::vector<model::Voice> ListVoices(const util::Deadline& deadline, const util::CancellationToken& cancel) override;

  model::OutputFormat NativeFormat() const override {
    return model::OutputFormat::kMp3;
  }

  void Synthesize(const SynthesisRequest& request, const util::Deadline& deadline,
                  const util::CancellationToken& cancel) override;

  // Exposed for tests.
  std::vector<std::string> SynthesisCommand(const SynthesisRequest& request) const;

 private:
  std::string         binary_;
  util::ProcessRunner runner_;
};

} // namespace speechmaker::engine
