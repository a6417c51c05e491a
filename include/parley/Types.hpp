/**
 * Types.hpp - Core data model shared by all pipeline stages
 */

#pragma once

#include "parley/Errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parley {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * Fixed-duration block of mono PCM16 audio. Immutable once produced.
 */
struct AudioFrame {
    std::string session_id;
    uint64_t sequence_number = 0;
    TimePoint capture_timestamp;
    int duration_ms = 0;
    std::vector<int16_t> samples;
};

enum class CloseReason {
    SpeechEnd,
    MaxDuration,
    Flush
};

/**
 * Contiguous span of detected speech.
 */
struct Utterance {
    std::string session_id;
    uint64_t utterance_id = 0;
    uint64_t start_frame_seq = 0;
    uint64_t end_frame_seq = 0;
    std::vector<AudioFrame> frames;
    CloseReason close_reason = CloseReason::SpeechEnd;

    int durationMs() const;
    size_t sampleCount() const;

    // Concatenated samples as float in [-1, 1]
    std::vector<float> toFloat() const;
};

struct TranscriptEvent {
    std::string session_id;
    uint64_t utterance_id = 0;
    std::string text;
    bool is_final = false;
    float confidence = 0.0f;
    std::optional<std::string> speaker_label;
    std::optional<std::string> speaker_tag;  // raw tag from the recognizer
    TimePoint emitted_at;
    ErrorCode error = ErrorCode::None;
    int attempt = 0;

    bool failed() const { return error != ErrorCode::None; }
};

enum class Speaker {
    User,
    Assistant
};

/**
 * Conversation-level state driven by the TurnManager.
 */
enum class ConversationState {
    Idle,
    UserSpeaking,
    UserTurnClosing,
    AssistantThinking,
    AssistantSpeaking
};

/**
 * Lifecycle of a single Turn. Only moves forward.
 */
enum class TurnState {
    UserSpeaking,
    UserTurnClosing,
    AssistantThinking,
    AssistantSpeaking,
    Completed,
    Cancelled,
    Failed
};

struct Turn {
    std::string session_id;
    uint64_t turn_id = 0;
    Speaker speaker = Speaker::User;
    TurnState state = TurnState::UserSpeaking;
    TimePoint started_at;
    std::optional<TimePoint> ended_at;
    std::string text;
    bool degraded = false;

    bool isTerminal() const;
};

struct SynthesisChunk {
    uint64_t turn_id = 0;
    uint64_t chunk_index = 0;
    std::vector<uint8_t> audio_bytes;  // PCM16 little-endian mono
    int sample_rate = 0;
    std::string text;
    bool is_final = false;
    bool fallback = false;  // silence marker for a failed or missing slot
};

const char* toString(ConversationState state);
const char* toString(TurnState state);
const char* toString(Speaker speaker);
const char* toString(CloseReason reason);

/**
 * True if a turn may move from `from` to `to`. Terminal states never move.
 */
bool canTransition(TurnState from, TurnState to);

} // namespace parley
