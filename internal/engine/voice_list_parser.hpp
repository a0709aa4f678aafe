#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/voice.hpp"

namespace speechmaker::engine {

/*
  Parses `--list-voices` output. Accepted shapes:

    Name: en-US-AriaNeural, Gender: Female, Language: en-US     (one line)

    Name: Microsoft Server Speech ... (en-US, AriaNeural)         (blocks)
    ShortName: en-US-AriaNeural
    Gender: Female
    Locale: en-US

    Name                     Gender    ...                         (table)
    -----------------------  --------
    en-US-AriaNeural         Female    ...

  The first English voice is flagged as default. Returns an empty vector when
  nothing could be parsed.
*/
std::vector<model::Voice> ParseVoiceList(std::string_view output);

// Locale prefix of a short voice name ("en-US-AriaNeural" -> "en-US").
std::string LocaleFromVoiceId(std::string_view id);

// edge-tts --rate value: round((speed - 1) * 100) with explicit sign.
std::string FormatRate(double speed);

} // namespace speechmaker::engine
