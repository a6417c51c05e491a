/**
 * Events.hpp - Structured events emitted outward by a session pipeline
 */

#pragma once

#include "parley/Types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace parley {

enum class EventType {
    SpeechStarted,
    UtteranceClosed,
    PartialTranscript,
    FinalTranscript,
    TurnStateChanged,
    Error,
    UnableToRespond,
    SessionClosed
};

const char* toString(EventType type);

struct PipelineEvent {
    EventType type = EventType::Error;
    std::string session_id;
    TimePoint emitted_at;

    // Set for transcript and utterance events
    std::optional<TranscriptEvent> transcript;
    uint64_t utterance_id = 0;

    // Set for TurnStateChanged
    uint64_t turn_id = 0;
    Speaker speaker = Speaker::User;
    ConversationState from = ConversationState::Idle;
    ConversationState to = ConversationState::Idle;
    TurnState turn_state = TurnState::UserSpeaking;

    // Set for Error / UnableToRespond
    PipelineError error;
};

using EventCallback = std::function<void(const PipelineEvent&)>;
using ChunkCallback = std::function<void(const SynthesisChunk&)>;

/**
 * Outward sinks supplied by the transport. Both may be called from
 * pipeline threads and must not block for long.
 */
struct OutputSinks {
    EventCallback onEvent;
    ChunkCallback onAudio;
};

} // namespace parley
