/**
 * SynthesisStreamer.hpp - Streams assistant text to ordered audio chunks
 *
 * Text arriving from the generator is cut into chunks, synthesized by a
 * small worker pool and delivered to the output sink strictly in chunk
 * order. One assistant turn is active at a time.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Errors.hpp"
#include "parley/Events.hpp"
#include "parley/core/CancellationToken.hpp"
#include "parley/tts/Synthesizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace parley::tts {

class SynthesisStreamer {
public:
    struct Callbacks {
        ChunkCallback onChunk;                                    // ordered delivery
        std::function<void(uint64_t turn_id)> onFirstAudio;       // chunk 0 delivered
        std::function<void(uint64_t turn_id)> onTurnDelivered;    // final chunk delivered
        std::function<void(uint64_t turn_id, const PipelineError&)> onError;
    };

    struct Stats {
        uint64_t chunks_delivered = 0;
        uint64_t fallbacks = 0;          // silence substituted for a failed chunk
        uint64_t discarded = 0;          // results dropped after cancellation
        uint64_t synthesis_errors = 0;
    };

    SynthesisStreamer(std::string session_id,
                      const SynthesisConfig& config,
                      const QueueConfig& queues,
                      std::shared_ptr<Synthesizer> synthesizer,
                      core::CancellationToken session_token,
                      Callbacks callbacks);
    ~SynthesisStreamer();

    SynthesisStreamer(const SynthesisStreamer&) = delete;
    SynthesisStreamer& operator=(const SynthesisStreamer&) = delete;

    void start();
    void stop();

    /**
     * Start a new assistant turn. Any other active turn is cancelled first.
     */
    void begin(uint64_t turn_id);

    /**
     * Append generated text. Blocks while the job queue is full.
     * Returns false if the turn is not active (never begun or cancelled).
     */
    bool feed(uint64_t turn_id, const std::string& text);

    /**
     * No more text for this turn. The remainder becomes the final chunk;
     * with no remainder an empty final marker closes the turn.
     */
    bool finish(uint64_t turn_id);

    /**
     * Cancel the turn and discard its queued and buffered chunks. Once this
     * returns no further chunk of the turn reaches the sink. Idempotent.
     */
    void cancel(uint64_t turn_id);

    bool isActive(uint64_t turn_id) const;

    /**
     * Chunks of the active turn not yet delivered.
     */
    size_t pendingChunks() const;

    Stats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::tts
