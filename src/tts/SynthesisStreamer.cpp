/**
 * SynthesisStreamer.cpp - Parallel chunk synthesis with in-order delivery
 *
 * Workers synthesize the next chunks in the background while earlier ones
 * are delivered. A reorder buffer keyed by chunk index releases chunks to
 * the sink strictly in order.
 */

#include "parley/tts/SynthesisStreamer.hpp"

#include "parley/core/BoundedQueue.hpp"
#include "parley/core/CallRunner.hpp"
#include "parley/tts/TextChunker.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace parley::tts {

namespace {

struct Job {
    uint64_t turn_id = 0;
    uint64_t index = 0;
    std::string text;
    bool is_final = false;
    core::CancellationToken token;
};

struct Slot {
    std::string text;
    bool is_final = false;
    bool started = false;
    TimePoint started_at;
};

} // anonymous namespace

struct SynthesisStreamer::Impl {
    struct ActiveTurn {
        uint64_t id = 0;
        core::CancellationToken token;
        TextChunker chunker;
        uint64_t next_index = 0;      // next index to assign
        uint64_t next_deliver = 0;    // next index owed to the sink
        bool finished = false;
        std::map<uint64_t, Slot> outstanding;
        std::map<uint64_t, SynthesisChunk> ready;

        ActiveTurn(uint64_t turn_id, core::CancellationToken t, const SynthesisConfig& cfg)
            : id(turn_id)
            , token(std::move(t))
            , chunker(cfg.min_clause_chars, cfg.max_chunk_chars)
        {
        }
    };

    std::string session_id;
    SynthesisConfig config;
    size_t reorder_capacity;
    std::shared_ptr<Synthesizer> synthesizer;
    core::CancellationToken session_token;
    Callbacks callbacks;

    core::BoundedQueue<Job> jobs;
    core::CallRunner runner;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::mutex delivery_mutex;  // held across every sink call and by cancel()
    std::optional<ActiveTurn> turn;

    std::vector<std::thread> workers;
    std::thread delivery_thread;
    std::atomic<bool> running{false};

    std::atomic<uint64_t> chunks_delivered{0};
    std::atomic<uint64_t> fallbacks{0};
    std::atomic<uint64_t> discarded{0};
    std::atomic<uint64_t> synthesis_errors{0};

    Impl(std::string sid, const SynthesisConfig& cfg, const QueueConfig& queues,
         std::shared_ptr<Synthesizer> synth, core::CancellationToken token, Callbacks cbs)
        : session_id(std::move(sid))
        , config(cfg)
        , reorder_capacity(queues.reorder_capacity == 0 ? 1 : queues.reorder_capacity)
        , synthesizer(std::move(synth))
        , session_token(std::move(token))
        , callbacks(std::move(cbs))
        , jobs(queues.synthesis_job_capacity)
    {
    }

    // Caller holds `mutex`.
    Job makeJob(std::string text, bool is_final) {
        Job job;
        job.turn_id = turn->id;
        job.index = turn->next_index++;
        job.is_final = is_final;
        job.token = turn->token;
        turn->outstanding[job.index] = Slot{text, is_final, false, TimePoint{}};
        job.text = std::move(text);
        return job;
    }

    bool enqueue(std::vector<Job>& pending) {
        for (auto& job : pending) {
            // Backpressure: the generator thread waits here while the queue is full
            while (!jobs.pushFor(std::move(job), std::chrono::milliseconds(50))) {
                if (!running || job.token.isCancelled() || jobs.closed()) {
                    return false;
                }
            }
        }
        return true;
    }

    SynthesisChunk silenceFor(const std::string& text, uint64_t turn_id, uint64_t index, bool is_final) {
        SynthesisChunk chunk;
        chunk.turn_id = turn_id;
        chunk.chunk_index = index;
        chunk.text = text;
        chunk.is_final = is_final;
        chunk.fallback = true;
        chunk.sample_rate = config.fallback_sample_rate;
        size_t samples = static_cast<size_t>(text.size()) * config.fallback_ms_per_char *
                         config.fallback_sample_rate / 1000;
        chunk.audio_bytes.assign(samples * 2, 0);
        return chunk;
    }

    SynthesisResult synthesizeWithRetry(const Job& job) {
        auto synth = synthesizer;
        const VoiceParams voice = config.voice;
        const std::string text = job.text;

        auto attempt_fn = [&](int) -> SynthesisResult {
            std::function<SynthesisResult(const core::CancellationToken&)> call =
                [synth, voice, text](const core::CancellationToken& cancel) {
                    return synth->synthesize(text, voice, cancel);
                };

            auto outcome = runner.run<SynthesisResult>(std::move(call), config.chunk_timeout, job.token);

            SynthesisResult result;
            switch (outcome.status) {
                case core::CallStatus::Completed:
                    result = std::move(*outcome.value);
                    if (result.error == ErrorCode::None &&
                        (result.audio.empty() || result.sample_rate <= 0)) {
                        result.error = ErrorCode::SynthesisError;
                        result.error_message = "empty audio";
                    }
                    break;
                case core::CallStatus::TimedOut:
                    result.error = ErrorCode::SynthesisError;
                    result.error_message = "no audio after " + std::to_string(config.chunk_timeout.count()) + "ms";
                    break;
                case core::CallStatus::Cancelled:
                    result.error = ErrorCode::CancellationRace;
                    result.error_message = "turn cancelled";
                    break;
                case core::CallStatus::Failed:
                    result.error = ErrorCode::SynthesisError;
                    result.error_message = outcome.error;
                    break;
            }
            return result;
        };

        auto on_failure = [&](int attempt, const SynthesisResult& result) {
            std::cerr << "[SynthesisStreamer] " << session_id << ": turn " << job.turn_id
                      << " chunk " << job.index << " attempt " << attempt << "/"
                      << config.retry.maxAttempts() << " failed: " << toString(result.error)
                      << " (" << result.error_message << ")" << std::endl;
        };

        return config.retry.execute(attempt_fn, job.token, on_failure);
    }

    void workerLoop() {
        while (true) {
            auto job = jobs.popFor(std::chrono::milliseconds(50));
            if (!job) {
                if (jobs.closed()) break;
                continue;
            }
            if (job->token.isCancelled()) {
                ++discarded;
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (!turn || turn->id != job->turn_id) {
                    ++discarded;
                    continue;
                }
                auto it = turn->outstanding.find(job->index);
                if (it != turn->outstanding.end()) {
                    it->second.started = true;
                    it->second.started_at = Clock::now();
                }
            }

            SynthesisChunk chunk;
            chunk.turn_id = job->turn_id;
            chunk.chunk_index = job->index;
            chunk.text = job->text;
            chunk.is_final = job->is_final;

            SynthesisResult result = synthesizeWithRetry(*job);
            if (job->token.isCancelled() || result.error == ErrorCode::CancellationRace) {
                ++discarded;
                continue;
            }

            if (result.error != ErrorCode::None) {
                ++synthesis_errors;
                ++fallbacks;
                chunk = silenceFor(job->text, job->turn_id, job->index, job->is_final);
                if (callbacks.onError) {
                    callbacks.onError(job->turn_id, {ErrorCode::SynthesisError,
                        "chunk " + std::to_string(job->index) + ": " + result.error_message});
                }
            } else {
                chunk.audio_bytes = std::move(result.audio);
                chunk.sample_rate = result.sample_rate;
            }

            store(std::move(chunk), job->token);
        }
    }

    void store(SynthesisChunk&& chunk, const core::CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex);
        // Bounded reorder buffer; the chunk owed next is always accepted
        while (turn && turn->id == chunk.turn_id && !token.isCancelled() &&
               turn->ready.size() >= reorder_capacity && chunk.chunk_index != turn->next_deliver) {
            cv.wait_for(lock, std::chrono::milliseconds(20));
        }
        if (!turn || turn->id != chunk.turn_id || token.isCancelled() ||
            chunk.chunk_index < turn->next_deliver || turn->ready.count(chunk.chunk_index) > 0) {
            ++discarded;
            return;
        }
        turn->outstanding.erase(chunk.chunk_index);
        turn->ready.emplace(chunk.chunk_index, std::move(chunk));
        cv.notify_all();
    }

    void deliveryLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (running) {
            if (!turn) {
                cv.wait_for(lock, std::chrono::milliseconds(20));
                continue;
            }

            auto it = turn->ready.find(turn->next_deliver);
            if (it == turn->ready.end()) {
                auto slot = turn->outstanding.find(turn->next_deliver);
                if (slot != turn->outstanding.end() && slot->second.started &&
                    Clock::now() - slot->second.started_at > config.reorder_timeout) {
                    std::cerr << "[SynthesisStreamer] " << session_id << ": turn " << turn->id
                              << " chunk " << slot->first << " missing after "
                              << config.reorder_timeout.count() << "ms, substituting silence" << std::endl;
                    ++fallbacks;
                    turn->ready.emplace(slot->first, silenceFor(slot->second.text, turn->id,
                                                                slot->first, slot->second.is_final));
                    turn->outstanding.erase(slot);
                    continue;
                }
                cv.wait_for(lock, std::chrono::milliseconds(20));
                continue;
            }

            SynthesisChunk chunk = std::move(it->second);
            turn->ready.erase(it);
            core::CancellationToken token = turn->token;
            const uint64_t turn_id = turn->id;
            lock.unlock();

            {
                std::lock_guard<std::mutex> delivery(delivery_mutex);
                if (token.isCancelled()) {
                    ++discarded;
                } else {
                    if (callbacks.onChunk) {
                        callbacks.onChunk(chunk);
                    }
                    ++chunks_delivered;
                    if (chunk.chunk_index == 0 && callbacks.onFirstAudio) {
                        callbacks.onFirstAudio(turn_id);
                    }
                    if (chunk.is_final && callbacks.onTurnDelivered) {
                        callbacks.onTurnDelivered(turn_id);
                    }
                }
            }

            lock.lock();
            if (turn && turn->id == turn_id) {
                ++turn->next_deliver;
                if (chunk.is_final) {
                    turn.reset();
                }
            }
            cv.notify_all();
        }
    }

    void cancel(uint64_t turn_id) {
        std::lock_guard<std::mutex> delivery(delivery_mutex);
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!turn || turn->id != turn_id) {
                return;
            }
            turn->token.cancel();
            dropped = turn->ready.size();
            turn.reset();
        }
        dropped += jobs.removeIf([turn_id](const Job& job) { return job.turn_id == turn_id; });
        discarded += dropped;
        cv.notify_all();
        std::cout << "[SynthesisStreamer] " << session_id << ": turn " << turn_id
                  << " cancelled, " << dropped << " chunks discarded" << std::endl;
    }
};

SynthesisStreamer::SynthesisStreamer(std::string session_id,
                                     const SynthesisConfig& config,
                                     const QueueConfig& queues,
                                     std::shared_ptr<Synthesizer> synthesizer,
                                     core::CancellationToken session_token,
                                     Callbacks callbacks)
    : impl_(std::make_unique<Impl>(std::move(session_id), config, queues,
                                   std::move(synthesizer), std::move(session_token),
                                   std::move(callbacks)))
{
}

SynthesisStreamer::~SynthesisStreamer() {
    stop();
}

void SynthesisStreamer::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    int concurrency = impl_->config.concurrency < 1 ? 1 : impl_->config.concurrency;
    for (int i = 0; i < concurrency; ++i) {
        impl_->workers.emplace_back([this]() { impl_->workerLoop(); });
    }
    impl_->delivery_thread = std::thread([this]() { impl_->deliveryLoop(); });
    std::cout << "[SynthesisStreamer] " << impl_->session_id << ": started (" << concurrency
              << " workers, voice=" << impl_->config.voice.voice << ")" << std::endl;
}

void SynthesisStreamer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    std::optional<uint64_t> active;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->turn) {
            active = impl_->turn->id;
        }
    }
    if (active) {
        impl_->cancel(*active);
    }
    impl_->jobs.close();
    impl_->cv.notify_all();
    for (auto& worker : impl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    impl_->workers.clear();
    if (impl_->delivery_thread.joinable()) {
        impl_->delivery_thread.join();
    }
    impl_->runner.joinAll();
}

void SynthesisStreamer::begin(uint64_t turn_id) {
    std::optional<uint64_t> previous;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->turn && impl_->turn->id != turn_id) {
            previous = impl_->turn->id;
        } else if (impl_->turn) {
            return;
        }
    }
    if (previous) {
        std::cerr << "[SynthesisStreamer] " << impl_->session_id << ": turn " << *previous
                  << " still active at begin(" << turn_id << "), cancelling it" << std::endl;
        impl_->cancel(*previous);
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->turn.emplace(turn_id, impl_->session_token.child(), impl_->config);
}

bool SynthesisStreamer::feed(uint64_t turn_id, const std::string& text) {
    std::vector<Job> pending;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->turn || impl_->turn->id != turn_id || impl_->turn->finished) {
            return false;
        }
        for (auto& chunk : impl_->turn->chunker.feed(text)) {
            pending.push_back(impl_->makeJob(std::move(chunk), false));
        }
    }
    return impl_->enqueue(pending);
}

bool SynthesisStreamer::finish(uint64_t turn_id) {
    std::vector<Job> pending;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto& turn = impl_->turn;
        if (!turn || turn->id != turn_id || turn->finished) {
            return false;
        }
        turn->finished = true;
        std::string rest = turn->chunker.flush();
        if (rest.empty()) {
            // Empty final marker, delivered without synthesis
            SynthesisChunk marker;
            marker.turn_id = turn_id;
            marker.chunk_index = turn->next_index++;
            marker.is_final = true;
            turn->ready.emplace(marker.chunk_index, std::move(marker));
            impl_->cv.notify_all();
            return true;
        }
        pending.push_back(impl_->makeJob(std::move(rest), true));
    }
    return impl_->enqueue(pending);
}

void SynthesisStreamer::cancel(uint64_t turn_id) {
    impl_->cancel(turn_id);
}

bool SynthesisStreamer::isActive(uint64_t turn_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->turn && impl_->turn->id == turn_id;
}

size_t SynthesisStreamer::pendingChunks() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->turn) {
        return 0;
    }
    return impl_->turn->outstanding.size() + impl_->turn->ready.size();
}

SynthesisStreamer::Stats SynthesisStreamer::stats() const {
    Stats s;
    s.chunks_delivered = impl_->chunks_delivered;
    s.fallbacks = impl_->fallbacks;
    s.discarded = impl_->discarded;
    s.synthesis_errors = impl_->synthesis_errors;
    return s;
}

} // namespace parley::tts
