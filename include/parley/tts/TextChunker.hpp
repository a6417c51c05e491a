/**
 * TextChunker.hpp - Splits streamed LLM text into synthesizable units
 *
 * Sentence boundaries are preferred, then clause boundaries once the
 * buffer is long enough, then a forced cut at the last space.
 */

#pragma once

#include <string>
#include <vector>

namespace parley::tts {

class TextChunker {
public:
    TextChunker(int min_clause_chars, int max_chunk_chars);

    /**
     * Append text and return every chunk completed by it, in order.
     */
    std::vector<std::string> feed(const std::string& text);

    /**
     * Return the trimmed remainder and clear the buffer.
     */
    std::string flush();

    void reset() { buffer_.clear(); }
    const std::string& buffered() const { return buffer_; }

private:
    size_t findBoundary() const;

    int min_clause_chars_;
    int max_chunk_chars_;
    std::string buffer_;
};

} // namespace parley::tts
