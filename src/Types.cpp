/**
 * Types.cpp - Data model helpers and enum names
 */

#include "parley/Types.hpp"
#include "parley/Events.hpp"

namespace parley {

int Utterance::durationMs() const {
    int total = 0;
    for (const auto& frame : frames) {
        total += frame.duration_ms;
    }
    return total;
}

size_t Utterance::sampleCount() const {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.samples.size();
    }
    return total;
}

std::vector<float> Utterance::toFloat() const {
    std::vector<float> out;
    out.reserve(sampleCount());
    for (const auto& frame : frames) {
        for (int16_t s : frame.samples) {
            out.push_back(static_cast<float>(s) / 32768.0f);
        }
    }
    return out;
}

bool Turn::isTerminal() const {
    return state == TurnState::Completed ||
           state == TurnState::Cancelled ||
           state == TurnState::Failed;
}

bool canTransition(TurnState from, TurnState to) {
    switch (from) {
        case TurnState::UserSpeaking:
            return to == TurnState::UserTurnClosing || to == TurnState::Cancelled;
        case TurnState::UserTurnClosing:
            return to == TurnState::Completed || to == TurnState::Cancelled;
        case TurnState::AssistantThinking:
            return to == TurnState::AssistantSpeaking || to == TurnState::Cancelled ||
                   to == TurnState::Failed;
        case TurnState::AssistantSpeaking:
            return to == TurnState::Completed || to == TurnState::Cancelled ||
                   to == TurnState::Failed;
        case TurnState::Completed:
        case TurnState::Cancelled:
        case TurnState::Failed:
            return false;
    }
    return false;
}

const char* toString(ConversationState state) {
    switch (state) {
        case ConversationState::Idle: return "IDLE";
        case ConversationState::UserSpeaking: return "USER_SPEAKING";
        case ConversationState::UserTurnClosing: return "USER_TURN_CLOSING";
        case ConversationState::AssistantThinking: return "ASSISTANT_THINKING";
        case ConversationState::AssistantSpeaking: return "ASSISTANT_SPEAKING";
    }
    return "UNKNOWN";
}

const char* toString(TurnState state) {
    switch (state) {
        case TurnState::UserSpeaking: return "USER_SPEAKING";
        case TurnState::UserTurnClosing: return "USER_TURN_CLOSING";
        case TurnState::AssistantThinking: return "ASSISTANT_THINKING";
        case TurnState::AssistantSpeaking: return "ASSISTANT_SPEAKING";
        case TurnState::Completed: return "COMPLETED";
        case TurnState::Cancelled: return "CANCELLED";
        case TurnState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* toString(Speaker speaker) {
    return speaker == Speaker::User ? "USER" : "ASSISTANT";
}

const char* toString(CloseReason reason) {
    switch (reason) {
        case CloseReason::SpeechEnd: return "speech-end";
        case CloseReason::MaxDuration: return "max-duration";
        case CloseReason::Flush: return "flush";
    }
    return "unknown";
}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::MalformedAudio: return "MalformedAudioError";
        case ErrorCode::BackpressureDrop: return "BackpressureDrop";
        case ErrorCode::RecognitionTimeout: return "RecognitionTimeout";
        case ErrorCode::RecognitionError: return "RecognitionError";
        case ErrorCode::GenerationError: return "GenerationError";
        case ErrorCode::GenerationTimeout: return "GenerationTimeout";
        case ErrorCode::SynthesisError: return "SynthesisError";
        case ErrorCode::CancellationRace: return "CancellationRace";
        case ErrorCode::SessionClosed: return "SessionClosed";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

const char* toString(EventType type) {
    switch (type) {
        case EventType::SpeechStarted: return "speech-started";
        case EventType::UtteranceClosed: return "utterance-closed";
        case EventType::PartialTranscript: return "partial-transcript";
        case EventType::FinalTranscript: return "final-transcript";
        case EventType::TurnStateChanged: return "turn-state-changed";
        case EventType::Error: return "error";
        case EventType::UnableToRespond: return "unable-to-respond";
        case EventType::SessionClosed: return "session-closed";
    }
    return "unknown";
}

} // namespace parley
