#include "text_chunker.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace speechmaker::chunking {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsTerminator(char c) {
  return c == '.' || c == '!' || c == '?';
}

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// End (exclusive) of the chunk starting at `pos`; the window is [pos, limit).
std::size_t FindCut(std::string_view text, std::size_t pos, std::size_t limit) {
  // sentence terminator followed by whitespace
  for (std::size_t i = limit; i-- > pos;) {
    if (IsTerminator(text[i]) && i + 1 < text.size() && IsSpace(text[i + 1])) {
      return i + 1;
    }
  }

  // word boundary: whitespace right after a non-whitespace character
  for (std::size_t j = limit; j > pos; --j) {
    if (IsSpace(text[j]) && !IsSpace(text[j - 1])) {
      return j;
    }
  }

  std::size_t end = limit;
  while (end > pos + 1 && IsContinuationByte(text[end])) {
    --end;
  }
  return end;
}

} // namespace

std::vector<std::string> Split(std::string_view text, std::size_t max_chunk_chars) {
  if (max_chunk_chars == 0) {
    throw util::InvalidArgument("max chunk length must be positive");
  }

  if (text.size() <= max_chunk_chars) {
    return {std::string(text)};
  }

  std::vector<std::string> chunks;
  std::size_t              pos = 0;

  while (pos < text.size()) {
    const std::size_t limit = pos + max_chunk_chars;
    if (limit >= text.size()) {
      chunks.emplace_back(text.substr(pos));
      break;
    }

    const std::size_t end = FindCut(text, pos, limit);
    chunks.emplace_back(text.substr(pos, end - pos));

    pos = end;
    while (pos < text.size() && IsSpace(text[pos])) {
      ++pos;
    }
  }

  return chunks;
}

} // namespace speechmaker::chunking
