#include "chunker.hpp"
#include "../util.hpp"
#include <sstream>

namespace lunacore {

std::vector<std::string> split_paragraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    std::string current;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        bool is_blank = line.find_first_not_of(" \t") == std::string::npos;
        if (is_blank) {
            std::string para = trim(current);
            if (!para.empty()) paragraphs.push_back(std::move(para));
            current.clear();
            continue;
        }
        if (!current.empty()) current += '\n';
        current += line;
    }

    std::string para = trim(current);
    if (!para.empty()) paragraphs.push_back(std::move(para));
    return paragraphs;
}

std::vector<std::string> chunk_text(const std::string& text, size_t max_chars) {
    std::vector<std::string> chunks;
    std::string current;
    size_t current_chars = 0;

    for (auto& para : split_paragraphs(text)) {
        if (!current.empty() && current_chars + para.size() > max_chars) {
            chunks.push_back(std::move(current));
            current.clear();
            current_chars = 0;
        }
        if (!current.empty()) current += "\n\n";
        current += para;
        current_chars += para.size();
    }

    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

} // namespace lunacore
