#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace speechmaker::chunking {

/*
  Splits text into ordered chunks of at most `max_chunk_chars` bytes.

  Cut preference inside each window: after the last sentence terminator
  (. ! ? followed by whitespace), then at the last word boundary, then a hard
  cut (moved back to a UTF-8 character boundary when possible). Whitespace at
  cut points is consumed; everything else is preserved, so the chunks
  interleaved with the consumed whitespace rebuild the input.

  Text that already fits is returned unchanged as the only chunk.
  Throws util::InvalidArgument when max_chunk_chars is 0.
*/
std::vector<std::string> Split(std::string_view text, std::size_t max_chunk_chars);

} // namespace speechmaker::chunking
