/**
 * Config.hpp - Explicit per-session pipeline configuration
 *
 * Passed by value at pipeline construction; there is no process-wide
 * mutable configuration.
 */

#pragma once

#include "parley/core/RetryPolicy.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace parley {

struct AudioFormatConfig {
    int sample_rate = 16000;
    int channels = 1;
    int frame_ms = 20;
    size_t max_payload_bytes = 1 << 20;
};

enum class DetectorKind {
    Energy,
    Fvad
};

struct VadConfig {
    DetectorKind detector = DetectorKind::Energy;
    float threshold = 0.02f;         // score in [0, 1]
    float smoothing = 0.0f;          // EMA weight of the previous score, energy detector only
    int fvad_mode = 2;               // 0 (quality) .. 3 (very aggressive)
    int start_frames = 3;            // N consecutive voiced frames to open
    int end_frames = 25;             // M consecutive unvoiced frames to close
    int max_utterance_ms = 15000;
};

struct QueueConfig {
    size_t utterance_capacity = 8;
    size_t turn_event_capacity = 256;
    size_t synthesis_job_capacity = 16;
    size_t reorder_capacity = 8;
};

struct RecognitionConfig {
    std::string language_hint = "en";
    int max_in_flight = 1;
    bool ordering_tags = false;  // collaborator tags results per utterance
    std::chrono::milliseconds timeout{8000};
    core::RetryPolicy retry{1, std::chrono::milliseconds(200), 2.0, std::chrono::milliseconds(2000)};
    int min_utterance_ms = 0;
};

enum class BargeInPolicy {
    Interrupt,
    Queue
};

struct TurnConfig {
    std::chrono::milliseconds end_of_turn_silence{600};
    BargeInPolicy barge_in = BargeInPolicy::Interrupt;
    std::chrono::milliseconds barge_in_grace{0};
    std::chrono::milliseconds tick{10};
};

struct GenerationConfig {
    std::chrono::milliseconds first_token_timeout{5000};
    core::RetryPolicy retry{0, std::chrono::milliseconds(250), 2.0, std::chrono::milliseconds(1000)};
    std::string system_prompt;
    int max_tokens = 512;
    float temperature = 0.7f;
};

struct VoiceParams {
    std::string voice = "default";
    float speed = 1.0f;
    std::string language = "en";
};

struct SynthesisConfig {
    VoiceParams voice;
    int min_clause_chars = 40;
    int max_chunk_chars = 200;
    int concurrency = 2;
    std::chrono::milliseconds chunk_timeout{4000};
    std::chrono::milliseconds reorder_timeout{6000};
    core::RetryPolicy retry{0, std::chrono::milliseconds(100), 2.0, std::chrono::milliseconds(500)};
    int fallback_sample_rate = 24000;
    int fallback_ms_per_char = 60;  // estimated speaking time for silence markers
};

struct ContextConfig {
    size_t max_turns = 20;
    size_t max_tokens = 2048;  // whitespace-separated words
    std::chrono::seconds max_age{3600};
    std::chrono::seconds session_idle_expiry{900};
};

struct LogConfig {
    bool verbose = false;
};

struct PipelineConfig {
    AudioFormatConfig audio;
    VadConfig vad;
    QueueConfig queues;
    RecognitionConfig recognition;
    TurnConfig turn;
    GenerationConfig generation;
    SynthesisConfig synthesis;
    ContextConfig context;
    LogConfig log;
};

const std::vector<int>& supportedSampleRates();
const std::vector<std::string>& supportedLanguages();

/**
 * Parse a JSON document into a config, starting from defaults.
 * Returns nothing and fills `error` on malformed input.
 */
std::optional<PipelineConfig> parseConfig(const std::string& json_text, std::string* error = nullptr);
std::optional<PipelineConfig> loadConfigFile(const std::string& path, std::string* error = nullptr);

/**
 * List every problem with `config`. Empty means valid.
 */
std::vector<std::string> validateConfig(const PipelineConfig& config);

} // namespace parley
