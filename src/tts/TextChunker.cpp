/**
 * TextChunker.cpp - Sentence/clause chunking for streaming synthesis
 */

#include "parley/tts/TextChunker.hpp"

#include <algorithm>
#include <cctype>

namespace parley::tts {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

bool isSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isClauseEnd(char c) {
    return c == ',' || c == ';' || c == ':';
}

} // anonymous namespace

TextChunker::TextChunker(int min_clause_chars, int max_chunk_chars)
    : min_clause_chars_(std::max(0, min_clause_chars))
    , max_chunk_chars_(std::max(1, max_chunk_chars))
{
}

// Returns the length of the first complete chunk, or npos if none yet.
// A returned length is never zero.
size_t TextChunker::findBoundary() const {
    if (buffer_.empty()) {
        return std::string::npos;
    }
    size_t clause = std::string::npos;

    for (size_t i = 0; i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (c == '\n') {
            return i + 1;
        }
        if (i + 1 >= buffer_.size()) {
            break;
        }
        // Only trigger on "punctuation + space" so "3.5" or "e.g" do not split
        bool followed_by_space = std::isspace(static_cast<unsigned char>(buffer_[i + 1]));
        if (isSentenceEnd(c) && followed_by_space) {
            return i + 1;
        }
        if (clause == std::string::npos && isClauseEnd(c) && followed_by_space &&
            static_cast<int>(i + 1) >= min_clause_chars_) {
            clause = i + 1;
        }
    }

    if (clause != std::string::npos) {
        return clause;
    }

    if (static_cast<int>(buffer_.size()) >= max_chunk_chars_) {
        size_t cut = buffer_.find_last_of(" \t", max_chunk_chars_);
        if (cut == std::string::npos || cut == 0) {
            return max_chunk_chars_;
        }
        return cut;
    }

    return std::string::npos;
}

std::vector<std::string> TextChunker::feed(const std::string& text) {
    std::vector<std::string> chunks;
    buffer_ += text;

    size_t boundary;
    while ((boundary = findBoundary()) != std::string::npos) {
        std::string chunk = trim(buffer_.substr(0, boundary));
        buffer_.erase(0, boundary);
        if (!chunk.empty()) {
            chunks.push_back(std::move(chunk));
        }
    }

    // Leading whitespace left over from the previous boundary
    size_t first = 0;
    while (first < buffer_.size() && std::isspace(static_cast<unsigned char>(buffer_[first]))) {
        ++first;
    }
    buffer_.erase(0, first);

    return chunks;
}

std::string TextChunker::flush() {
    std::string rest = trim(buffer_);
    buffer_.clear();
    return rest;
}

} // namespace parley::tts
