/**
 * Generator.hpp - Language-model collaborator contract
 */

#pragma once

#include "parley/Errors.hpp"
#include "parley/Types.hpp"
#include "parley/core/CancellationToken.hpp"

#include <functional>
#include <string>
#include <vector>

namespace parley::llm {

struct GenerationResult {
    ErrorCode error = ErrorCode::None;
    std::string error_message;
    size_t chunks = 0;
};

/**
 * Called once per text chunk in generation order. Return false to stop.
 */
using TextChunkCallback = std::function<bool(const std::string& chunk)>;

/**
 * Black-box text generator. `generate` blocks for the whole stream and
 * must return promptly once `cancel` is cancelled. Implementations may
 * throw; a throw mid-stream is treated as a GenerationError.
 */
class Generator {
public:
    virtual ~Generator() = default;

    virtual GenerationResult generate(const std::vector<Turn>& context,
                                      const std::string& user_text,
                                      const TextChunkCallback& on_chunk,
                                      const core::CancellationToken& cancel) = 0;
};

} // namespace parley::llm
