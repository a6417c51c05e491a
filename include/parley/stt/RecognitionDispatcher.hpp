/**
 * RecognitionDispatcher.hpp - Bounded-concurrency ASR requests per session
 *
 * Pulls closed utterances from the segmenter queue, runs each through the
 * recognizer under a timeout and retry budget, and emits partial and final
 * TranscriptEvents. Every utterance ends with exactly one final event, a
 * failed one (empty text, error attached) when the budget is exhausted.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Events.hpp"
#include "parley/Types.hpp"
#include "parley/core/BoundedQueue.hpp"
#include "parley/core/CallRunner.hpp"
#include "parley/core/CancellationToken.hpp"
#include "parley/session/SessionContext.hpp"
#include "parley/stt/Recognizer.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace parley::stt {

class RecognitionDispatcher {
public:
    struct Callbacks {
        std::function<void(TranscriptEvent&&)> onTranscript;
        std::function<void(uint64_t utterance_id, const PipelineError&)> onError;
    };

    struct Stats {
        uint64_t recognized = 0;
        uint64_t failed = 0;
        uint64_t timeouts = 0;  // individual attempts
        uint64_t skipped = 0;
    };

    RecognitionDispatcher(std::string session_id,
                          const RecognitionConfig& config,
                          std::shared_ptr<Recognizer> recognizer,
                          core::BoundedQueue<Utterance>& input,
                          const session::SessionContext& context,
                          core::CancellationToken session_token,
                          Callbacks callbacks);
    ~RecognitionDispatcher();

    RecognitionDispatcher(const RecognitionDispatcher&) = delete;
    RecognitionDispatcher& operator=(const RecognitionDispatcher&) = delete;

    void start();

    /**
     * Stop after draining the (closed) input queue. In-flight calls are
     * aborted only if the session token was cancelled.
     */
    void stop();

    Stats stats() const;

private:
    void workerLoop();
    void handle(Utterance&& utterance);
    void emit(TranscriptEvent&& event);

    std::string session_id_;
    RecognitionConfig config_;
    std::shared_ptr<Recognizer> recognizer_;
    core::BoundedQueue<Utterance>& input_;
    const session::SessionContext& context_;
    core::CancellationToken token_;
    Callbacks callbacks_;

    core::CallRunner runner_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> recognized_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace parley::stt
