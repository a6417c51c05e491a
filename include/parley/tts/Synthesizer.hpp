/**
 * Synthesizer.hpp - Speech-synthesis collaborator contract
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Errors.hpp"
#include "parley/core/CancellationToken.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace parley::tts {

struct SynthesisResult {
    std::vector<uint8_t> audio;  // PCM16 little-endian mono
    int sample_rate = 0;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

/**
 * Black-box text-to-speech engine. `synthesize` may block and may be called
 * concurrently from several workers. It must return promptly once `cancel`
 * is cancelled. Implementations may throw.
 */
class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    virtual SynthesisResult synthesize(const std::string& text,
                                       const VoiceParams& voice,
                                       const core::CancellationToken& cancel) = 0;
};

} // namespace parley::tts
