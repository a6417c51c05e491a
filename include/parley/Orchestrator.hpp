/**
 * Orchestrator.hpp - One conversation pipeline per session
 *
 * Connects: FrameBuffer → Segmenter → RecognitionDispatcher → TurnManager
 *           → Generator → SynthesisStreamer → output sink
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Events.hpp"
#include "parley/Types.hpp"
#include "parley/audio/SpeechDetector.hpp"
#include "parley/llm/Generator.hpp"
#include "parley/session/SessionContext.hpp"
#include "parley/session/TurnManager.hpp"
#include "parley/stt/RecognitionDispatcher.hpp"
#include "parley/stt/Recognizer.hpp"
#include "parley/tts/SynthesisStreamer.hpp"
#include "parley/tts/Synthesizer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace parley {

/**
 * External engines used by a session. Engines may be shared between
 * sessions; the detector is per session and defaults to makeDetector().
 */
struct Collaborators {
    std::shared_ptr<stt::Recognizer> recognizer;
    std::shared_ptr<llm::Generator> generator;
    std::shared_ptr<tts::Synthesizer> synthesizer;
    std::unique_ptr<audio::SpeechDetector> detector;
};

struct OrchestratorStats {
    uint64_t frames = 0;
    uint64_t malformed_payloads = 0;
    uint64_t utterances = 0;
    uint64_t utterances_dropped = 0;
    stt::RecognitionDispatcher::Stats recognition;
    session::TurnManager::Stats turns;
    tts::SynthesisStreamer::Stats synthesis;
};

class Orchestrator {
public:
    Orchestrator(std::string session_id,
                 const PipelineConfig& config,
                 Collaborators collaborators,
                 OutputSinks sinks);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Validate the configuration and start every stage.
     * @return false on invalid config or missing collaborator, see lastError()
     */
    bool start();

    /**
     * Feed raw PCM16 bytes from the transport. Runs framing and segmentation
     * on the calling thread. A malformed payload is dropped and reported;
     * the session continues. Returns SessionClosed once the session is closed.
     */
    PipelineError pushAudio(const uint8_t* data, size_t size);

    /**
     * Flush the open utterance, cancel in-flight work and stop all stages.
     * Emits SessionClosed. Idempotent.
     */
    void close();

    bool isOpen() const;
    const std::string& sessionId() const;
    ConversationState state() const;
    const session::SessionContext& context() const;
    OrchestratorStats stats() const;
    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
