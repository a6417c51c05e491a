/**
 * Recognizer.hpp - ASR collaborator contract
 */

#pragma once

#include "parley/Errors.hpp"
#include "parley/Types.hpp"
#include "parley/core/CancellationToken.hpp"

#include <functional>
#include <optional>
#include <string>

namespace parley::stt {

struct RecognitionResult {
    std::string text;
    float confidence = 0.0f;
    std::optional<std::string> speaker_tag;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

struct PartialResult {
    std::string text;
    float confidence = 0.0f;
    std::optional<std::string> speaker_tag;
};

using PartialCallback = std::function<void(const PartialResult&)>;

/**
 * Black-box speech recognizer. `recognize` may block; it must return
 * promptly once `cancel` is cancelled. Implementations may throw.
 */
class Recognizer {
public:
    virtual ~Recognizer() = default;

    virtual RecognitionResult recognize(const Utterance& utterance,
                                        const std::string& language_hint,
                                        const PartialCallback& on_partial,
                                        const core::CancellationToken& cancel) = 0;
};

} // namespace parley::stt
