#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace lunacore {

// Split text at blank-line boundaries. Paragraphs are trimmed; empty ones dropped.
std::vector<std::string> split_paragraphs(const std::string& text);

// Pack whole paragraphs into chunks. A paragraph joins the current chunk
// unless the paragraph characters already in it plus its own would exceed
// max_chars; separators ("\n\n") are not counted, so a chunk holding n
// paragraphs may be up to 2 * (n - 1) characters longer than max_chars.
// A paragraph longer than max_chars becomes its own chunk and is never split.
std::vector<std::string> chunk_text(const std::string& text, size_t max_chars);

} // namespace lunacore
