/**
 * WhisperRecognizer.cpp - Speech-to-text using whisper.cpp
 *
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "parley/stt/WhisperRecognizer.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace parley::stt {

namespace {

// Passed to whisper's C callbacks
struct CallState {
    const core::CancellationToken* cancel = nullptr;
    const PartialCallback* on_partial = nullptr;
    std::string text;
};

bool abortCallback(void* user_data) {
    auto* state = static_cast<CallState*>(user_data);
    return state->cancel->isCancelled();
}

void newSegmentCallback(whisper_context* /*ctx*/, whisper_state* state, int n_new, void* user_data) {
    auto* call = static_cast<CallState*>(user_data);
    const int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = n_segments - n_new; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text_from_state(state, i);
        if (segment_text) {
            call->text += segment_text;
        }
    }
    if (call->on_partial && *call->on_partial && !call->cancel->isCancelled()) {
        PartialResult partial;
        partial.text = call->text;
        (*call->on_partial)(partial);
    }
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

struct WhisperRecognizer::Impl {
    std::string model_path;
    int n_threads;

    whisper_context* ctx = nullptr;
    std::mutex ctx_mutex;

    Impl(const std::string& path, int threads)
        : model_path(path), n_threads(threads) {

        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[WhisperRecognizer] Failed to load model: " << model_path << std::endl;
            return;
        }

        std::cout << "[WhisperRecognizer] Model loaded: " << model_path << std::endl;
        std::cout << "[WhisperRecognizer] Threads: " << n_threads << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
};

WhisperRecognizer::WhisperRecognizer(const std::string& model_path, int n_threads)
    : impl_(std::make_unique<Impl>(model_path, n_threads)) {
}

WhisperRecognizer::~WhisperRecognizer() = default;

bool WhisperRecognizer::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string WhisperRecognizer::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->model_path + ")";
}

int WhisperRecognizer::getSampleRate() {
    return WHISPER_SAMPLE_RATE;
}

std::vector<float> WhisperRecognizer::resample(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }
    double ratio = static_cast<double>(from_rate) / to_rate;
    size_t out_size = static_cast<size_t>(input.size() / ratio);
    std::vector<float> output(out_size);
    for (size_t i = 0; i < out_size; ++i) {
        double src = i * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - idx;
        if (idx + 1 < input.size()) {
            output[i] = static_cast<float>(input[idx] * (1.0 - frac) + input[idx + 1] * frac);
        } else {
            output[i] = input.back();
        }
    }
    return output;
}

RecognitionResult WhisperRecognizer::recognize(const Utterance& utterance,
                                               const std::string& language_hint,
                                               const PartialCallback& on_partial,
                                               const core::CancellationToken& cancel) {
    RecognitionResult result;
    if (!impl_->ctx) {
        result.error = ErrorCode::RecognitionError;
        result.error_message = "model not loaded";
        return result;
    }

    std::vector<float> audio = utterance.toFloat();
    if (audio.empty()) {
        return result;
    }

    int duration_ms = utterance.durationMs();
    if (duration_ms > 0) {
        int source_rate = static_cast<int>(audio.size() * 1000 / duration_ms);
        audio = resample(audio, source_rate, WHISPER_SAMPLE_RATE);
    }

    CallState state;
    state.cancel = &cancel;
    state.on_partial = &on_partial;

    // Greedy decoding (faster)
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language_hint.empty() ? "auto" : language_hint.c_str();
    params.n_threads = impl_->n_threads;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_realtime = false;
    params.print_special = false;
    params.translate = false;
    params.single_segment = false;
    params.no_context = true;
    params.abort_callback = abortCallback;
    params.abort_callback_user_data = &state;
    params.new_segment_callback = newSegmentCallback;
    params.new_segment_callback_user_data = &state;

    std::lock_guard<std::mutex> lock(impl_->ctx_mutex);
    if (cancel.isCancelled()) {
        result.error = ErrorCode::CancellationRace;
        result.error_message = "cancelled";
        return result;
    }

    int rc = whisper_full(impl_->ctx, params, audio.data(), static_cast<int>(audio.size()));

    if (rc != 0) {
        if (cancel.isCancelled()) {
            result.error = ErrorCode::CancellationRace;
            result.error_message = "cancelled";
        } else {
            std::cerr << "[WhisperRecognizer] Transcription failed: " << rc << std::endl;
            result.error = ErrorCode::RecognitionError;
            result.error_message = "whisper_full returned " + std::to_string(rc);
        }
        return result;
    }

    // Confidence: mean token probability over all segments
    std::string text;
    double p_sum = 0.0;
    int p_count = 0;
    const int n_segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
        const int n_tokens = whisper_full_n_tokens(impl_->ctx, i);
        for (int j = 0; j < n_tokens; ++j) {
            p_sum += whisper_full_get_token_p(impl_->ctx, i, j);
            ++p_count;
        }
    }

    result.text = trim(text);
    result.confidence = p_count > 0 ? static_cast<float>(p_sum / p_count) : 0.0f;
    return result;
}

} // namespace parley::stt
