/**
 * RecognitionDispatcher.cpp - ASR dispatch with timeout, retry and ordering
 */

#include "parley/stt/RecognitionDispatcher.hpp"

#include <iostream>
#include <mutex>

namespace parley::stt {

namespace {

// Guards partial emission so a timed-out attempt cannot emit after its
// successor started or after the final event went out.
struct AttemptGate {
    std::mutex mutex;
    int attempt = 0;
    bool finished = false;
};

} // anonymous namespace

RecognitionDispatcher::RecognitionDispatcher(std::string session_id,
                                             const RecognitionConfig& config,
                                             std::shared_ptr<Recognizer> recognizer,
                                             core::BoundedQueue<Utterance>& input,
                                             const session::SessionContext& context,
                                             core::CancellationToken session_token,
                                             Callbacks callbacks)
    : session_id_(std::move(session_id))
    , config_(config)
    , recognizer_(std::move(recognizer))
    , input_(input)
    , context_(context)
    , token_(std::move(session_token))
    , callbacks_(std::move(callbacks))
{
    if (config_.max_in_flight > 1 && !config_.ordering_tags) {
        std::cerr << "[RecognitionDispatcher] " << session_id_
                  << ": max_in_flight > 1 without ordering tags, limiting to 1" << std::endl;
        config_.max_in_flight = 1;
    }
}

RecognitionDispatcher::~RecognitionDispatcher() {
    stop();
}

void RecognitionDispatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    for (int i = 0; i < config_.max_in_flight; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    std::cout << "[RecognitionDispatcher] " << session_id_ << ": started ("
              << config_.max_in_flight << " in flight, timeout="
              << config_.timeout.count() << "ms, retries=" << config_.retry.max_retries
              << ", language=" << config_.language_hint << ")" << std::endl;
}

void RecognitionDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    input_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    runner_.joinAll();
}

RecognitionDispatcher::Stats RecognitionDispatcher::stats() const {
    Stats s;
    s.recognized = recognized_;
    s.failed = failed_;
    s.timeouts = timeouts_;
    s.skipped = skipped_;
    return s;
}

void RecognitionDispatcher::workerLoop() {
    while (true) {
        auto utterance = input_.popFor(std::chrono::milliseconds(50));
        if (!utterance) {
            if (input_.closed() || token_.isCancelled()) {
                break;
            }
            continue;
        }
        if (token_.isCancelled()) {
            break;
        }
        handle(std::move(*utterance));
    }
}

void RecognitionDispatcher::handle(Utterance&& utterance) {
    auto shared = std::make_shared<const Utterance>(std::move(utterance));
    const uint64_t utterance_id = shared->utterance_id;

    if (shared->durationMs() < config_.min_utterance_ms) {
        ++skipped_;
        TranscriptEvent skipped;
        skipped.session_id = session_id_;
        skipped.utterance_id = utterance_id;
        skipped.is_final = true;
        skipped.emitted_at = Clock::now();
        emit(std::move(skipped));
        return;
    }

    auto gate = std::make_shared<AttemptGate>();
    auto recognizer = recognizer_;
    const std::string language = config_.language_hint;
    const std::string session_id = session_id_;

    auto attempt_fn = [&](int attempt) -> RecognitionResult {
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            gate->attempt = attempt;
        }

        std::function<RecognitionResult(const core::CancellationToken&)> call =
            [this, shared, gate, recognizer, language, session_id, attempt](
                const core::CancellationToken& cancel) {
                PartialCallback on_partial = [this, gate, cancel, session_id, attempt,
                                              utterance_id = shared->utterance_id](
                                                 const PartialResult& partial) {
                    std::lock_guard<std::mutex> lock(gate->mutex);
                    if (gate->finished || gate->attempt != attempt || cancel.isCancelled()) {
                        return;
                    }
                    TranscriptEvent event;
                    event.session_id = session_id;
                    event.utterance_id = utterance_id;
                    event.text = partial.text;
                    event.is_final = false;
                    event.confidence = partial.confidence;
                    if (partial.speaker_tag) {
                        event.speaker_tag = partial.speaker_tag;
                        event.speaker_label =
                            context_.speakerLabel(*partial.speaker_tag).value_or(*partial.speaker_tag);
                    }
                    event.emitted_at = Clock::now();
                    event.attempt = attempt;
                    emit(std::move(event));
                };
                return recognizer->recognize(*shared, language, on_partial, cancel);
            };

        auto outcome = runner_.run<RecognitionResult>(std::move(call), config_.timeout, token_);

        RecognitionResult result;
        switch (outcome.status) {
            case core::CallStatus::Completed:
                result = std::move(*outcome.value);
                break;
            case core::CallStatus::TimedOut:
                ++timeouts_;
                result.error = ErrorCode::RecognitionTimeout;
                result.error_message = "no result after " + std::to_string(config_.timeout.count()) + "ms";
                break;
            case core::CallStatus::Cancelled:
                result.error = ErrorCode::CancellationRace;
                result.error_message = "session cancelled";
                break;
            case core::CallStatus::Failed:
                result.error = ErrorCode::RecognitionError;
                result.error_message = outcome.error;
                break;
        }
        return result;
    };

    auto on_failure = [&](int attempt, const RecognitionResult& result) {
        std::cerr << "[RecognitionDispatcher] " << session_id_ << ": utterance " << utterance_id
                  << " attempt " << attempt << "/" << config_.retry.maxAttempts() << " failed: "
                  << toString(result.error) << " (" << result.error_message << ")" << std::endl;
    };

    RecognitionResult result = config_.retry.execute(attempt_fn, token_, on_failure);

    int final_attempt = 0;
    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->finished = true;
        final_attempt = gate->attempt;
    }

    if (token_.isCancelled()) {
        return;
    }

    TranscriptEvent event;
    event.session_id = session_id_;
    event.utterance_id = utterance_id;
    event.is_final = true;
    event.emitted_at = Clock::now();
    event.attempt = final_attempt;

    if (result.error != ErrorCode::None) {
        ++failed_;
        event.error = result.error;
        if (callbacks_.onError) {
            callbacks_.onError(utterance_id, {result.error, result.error_message});
        }
    } else {
        ++recognized_;
        event.text = result.text;
        event.confidence = result.confidence;
        if (result.speaker_tag) {
            event.speaker_tag = result.speaker_tag;
            event.speaker_label = context_.speakerLabel(*result.speaker_tag).value_or(*result.speaker_tag);
        }
    }

    emit(std::move(event));
}

void RecognitionDispatcher::emit(TranscriptEvent&& event) {
    if (callbacks_.onTranscript) {
        callbacks_.onTranscript(std::move(event));
    }
}

} // namespace parley::stt
