#pragma once

#include <string>
#include <string_view>

namespace speechmaker::util {

// Replaces every byte that is not part of a well-formed UTF-8 sequence with
// U+FFFD. Proto string fields and JSON output both require valid UTF-8;
// subprocess output does not guarantee it.
std::string ToValidUtf8(std::string_view bytes);

} // namespace speechmaker::util
