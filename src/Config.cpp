/**
 * Config.cpp - JSON configuration loading and validation
 */

#include "parley/Config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

namespace {

template <typename T>
void read(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename Duration>
void readDuration(const json& section, const char* key, Duration& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = Duration(it->get<long long>());
    }
}

void readRetry(const json& section, const char* key, core::RetryPolicy& out) {
    auto it = section.find(key);
    if (it == section.end() || !it->is_object()) {
        return;
    }
    read(*it, "max_retries", out.max_retries);
    readDuration(*it, "initial_backoff_ms", out.initial_backoff);
    read(*it, "multiplier", out.multiplier);
    readDuration(*it, "max_backoff_ms", out.max_backoff);
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    return (it != root.end() && it->is_object()) ? *it : empty;
}

} // anonymous namespace

const std::vector<int>& supportedSampleRates() {
    static const std::vector<int> rates = {8000, 16000, 22050, 32000, 44100, 48000};
    return rates;
}

const std::vector<std::string>& supportedLanguages() {
    static const std::vector<std::string> languages = {
        "auto", "en", "es", "fr", "de", "it", "pt", "ru", "ja", "ko", "zh",
        "ar", "hi", "tr", "pl", "nl", "sv", "da", "no", "fi"
    };
    return languages;
}

std::optional<PipelineConfig> parseConfig(const std::string& json_text, std::string* error) {
    PipelineConfig config;

    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            if (error) *error = "top-level JSON value must be an object";
            return std::nullopt;
        }

        const json& audio = section(root, "audio");
        read(audio, "sample_rate", config.audio.sample_rate);
        read(audio, "channels", config.audio.channels);
        read(audio, "frame_ms", config.audio.frame_ms);
        read(audio, "max_payload_bytes", config.audio.max_payload_bytes);

        const json& vad = section(root, "vad");
        std::string detector;
        read(vad, "detector", detector);
        if (detector == "fvad") {
            config.vad.detector = DetectorKind::Fvad;
        } else if (!detector.empty() && detector != "energy") {
            if (error) *error = "unknown vad.detector: " + detector;
            return std::nullopt;
        }
        read(vad, "threshold", config.vad.threshold);
        read(vad, "smoothing", config.vad.smoothing);
        read(vad, "fvad_mode", config.vad.fvad_mode);
        read(vad, "start_frames", config.vad.start_frames);
        read(vad, "end_frames", config.vad.end_frames);
        read(vad, "max_utterance_ms", config.vad.max_utterance_ms);

        const json& queues = section(root, "queues");
        read(queues, "utterance_capacity", config.queues.utterance_capacity);
        read(queues, "turn_event_capacity", config.queues.turn_event_capacity);
        read(queues, "synthesis_job_capacity", config.queues.synthesis_job_capacity);
        read(queues, "reorder_capacity", config.queues.reorder_capacity);

        const json& recognition = section(root, "recognition");
        read(recognition, "language_hint", config.recognition.language_hint);
        read(recognition, "max_in_flight", config.recognition.max_in_flight);
        read(recognition, "ordering_tags", config.recognition.ordering_tags);
        readDuration(recognition, "timeout_ms", config.recognition.timeout);
        readRetry(recognition, "retry", config.recognition.retry);
        read(recognition, "min_utterance_ms", config.recognition.min_utterance_ms);

        const json& turn = section(root, "turn");
        readDuration(turn, "end_of_turn_silence_ms", config.turn.end_of_turn_silence);
        std::string barge_in;
        read(turn, "barge_in", barge_in);
        if (barge_in == "queue") {
            config.turn.barge_in = BargeInPolicy::Queue;
        } else if (!barge_in.empty() && barge_in != "interrupt") {
            if (error) *error = "unknown turn.barge_in: " + barge_in;
            return std::nullopt;
        }
        readDuration(turn, "barge_in_grace_ms", config.turn.barge_in_grace);

        const json& generation = section(root, "generation");
        readDuration(generation, "first_token_timeout_ms", config.generation.first_token_timeout);
        readRetry(generation, "retry", config.generation.retry);
        read(generation, "system_prompt", config.generation.system_prompt);
        read(generation, "max_tokens", config.generation.max_tokens);
        read(generation, "temperature", config.generation.temperature);

        const json& synthesis = section(root, "synthesis");
        read(synthesis, "voice", config.synthesis.voice.voice);
        read(synthesis, "speed", config.synthesis.voice.speed);
        read(synthesis, "language", config.synthesis.voice.language);
        read(synthesis, "min_clause_chars", config.synthesis.min_clause_chars);
        read(synthesis, "max_chunk_chars", config.synthesis.max_chunk_chars);
        read(synthesis, "concurrency", config.synthesis.concurrency);
        readDuration(synthesis, "chunk_timeout_ms", config.synthesis.chunk_timeout);
        readDuration(synthesis, "reorder_timeout_ms", config.synthesis.reorder_timeout);
        readRetry(synthesis, "retry", config.synthesis.retry);
        read(synthesis, "fallback_sample_rate", config.synthesis.fallback_sample_rate);
        read(synthesis, "fallback_ms_per_char", config.synthesis.fallback_ms_per_char);

        const json& context = section(root, "context");
        read(context, "max_turns", config.context.max_turns);
        read(context, "max_tokens", config.context.max_tokens);
        readDuration(context, "max_age_s", config.context.max_age);
        readDuration(context, "session_idle_expiry_s", config.context.session_idle_expiry);

        const json& log = section(root, "log");
        read(log, "verbose", config.log.verbose);
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }

    return config;
}

std::optional<PipelineConfig> loadConfigFile(const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file.good()) {
        if (error) *error = "cannot open " + path;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str(), error);
}

std::vector<std::string> validateConfig(const PipelineConfig& config) {
    std::vector<std::string> problems;

    const auto& rates = supportedSampleRates();
    if (std::find(rates.begin(), rates.end(), config.audio.sample_rate) == rates.end()) {
        problems.push_back("unsupported sample rate: " + std::to_string(config.audio.sample_rate));
    }
    if (config.audio.channels < 1 || config.audio.channels > 2) {
        problems.push_back("channels must be 1 or 2");
    }
    if (config.audio.frame_ms <= 0 || config.audio.frame_ms > 100) {
        problems.push_back("frame_ms must be in 1..100");
    }
    if (config.vad.detector == DetectorKind::Fvad) {
        int ms = config.audio.frame_ms;
        if (ms != 10 && ms != 20 && ms != 30) {
            problems.push_back("fvad requires 10, 20 or 30 ms frames");
        }
        int rate = config.audio.sample_rate;
        if (rate != 8000 && rate != 16000 && rate != 32000 && rate != 48000) {
            problems.push_back("fvad requires 8, 16, 32 or 48 kHz audio");
        }
        if (config.vad.fvad_mode < 0 || config.vad.fvad_mode > 3) {
            problems.push_back("vad.fvad_mode must be in 0..3");
        }
    }
    if (config.vad.threshold < 0.0f || config.vad.threshold > 1.0f) {
        problems.push_back("vad.threshold must be in [0, 1]");
    }
    if (config.vad.smoothing < 0.0f || config.vad.smoothing >= 1.0f) {
        problems.push_back("vad.smoothing must be in [0, 1)");
    }
    if (config.vad.start_frames < 1 || config.vad.end_frames < 1) {
        problems.push_back("vad start/end frame counts must be positive");
    }
    if (config.vad.max_utterance_ms < config.audio.frame_ms * config.vad.start_frames) {
        problems.push_back("vad.max_utterance_ms shorter than the speech-start debounce");
    }
    if (config.queues.utterance_capacity == 0 || config.queues.turn_event_capacity == 0 ||
        config.queues.synthesis_job_capacity == 0 || config.queues.reorder_capacity == 0) {
        problems.push_back("queue capacities must be positive");
    }
    if (config.recognition.max_in_flight < 1) {
        problems.push_back("recognition.max_in_flight must be at least 1");
    }
    if (config.recognition.max_in_flight > 1 && !config.recognition.ordering_tags) {
        problems.push_back("recognition.max_in_flight > 1 requires ordering_tags");
    }
    const auto& languages = supportedLanguages();
    if (std::find(languages.begin(), languages.end(), config.recognition.language_hint) ==
        languages.end()) {
        problems.push_back("unsupported language: " + config.recognition.language_hint);
    }
    if (config.recognition.timeout.count() <= 0 || config.generation.first_token_timeout.count() <= 0 ||
        config.synthesis.chunk_timeout.count() <= 0) {
        problems.push_back("collaborator timeouts must be positive");
    }
    for (const auto* retry : {&config.recognition.retry, &config.generation.retry,
                              &config.synthesis.retry}) {
        if (retry->max_retries < 0 || retry->multiplier < 1.0) {
            problems.push_back("retry policies need max_retries >= 0 and multiplier >= 1");
            break;
        }
    }
    if (config.synthesis.concurrency < 1) {
        problems.push_back("synthesis.concurrency must be at least 1");
    }
    if (config.synthesis.max_chunk_chars < 1) {
        problems.push_back("synthesis.max_chunk_chars must be at least 1");
    }
    if (config.synthesis.min_clause_chars < 0) {
        problems.push_back("synthesis.min_clause_chars must not be negative");
    }
    if (config.synthesis.max_chunk_chars < config.synthesis.min_clause_chars) {
        problems.push_back("synthesis.max_chunk_chars must be >= min_clause_chars");
    }
    if (config.context.max_turns == 0) {
        problems.push_back("context.max_turns must be positive");
    }

    return problems;
}

} // namespace parley
