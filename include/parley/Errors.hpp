/**
 * Errors.hpp - Error taxonomy for the conversation pipeline
 *
 * Local failures are absorbed at stage boundaries and reported as
 * structured events carrying one of these codes.
 */

#pragma once

#include <string>

namespace parley {

enum class ErrorCode {
    None,
    MalformedAudio,      // payload dropped, session continues
    BackpressureDrop,    // oldest completed item dropped
    RecognitionTimeout,  // retried, then degraded to empty transcript
    RecognitionError,
    GenerationError,     // assistant turn ends FAILED
    GenerationTimeout,
    SynthesisError,      // chunk replaced by a silence marker
    CancellationRace,    // late item for a cancelled turn, discarded
    SessionClosed,       // session-fatal
    InvalidConfig
};

const char* toString(ErrorCode code);

struct PipelineError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    explicit operator bool() const { return code != ErrorCode::None; }
};

} // namespace parley
