/**
 * Orchestrator.cpp - Per-session pipeline wiring
 *
 * Connects: FrameBuffer → Segmenter → RecognitionDispatcher → TurnManager
 *           → Generator → SynthesisStreamer → output sink
 */

#include "parley/Orchestrator.hpp"
#include "parley/audio/FrameBuffer.hpp"
#include "parley/audio/VoiceActivitySegmenter.hpp"
#include "parley/core/BoundedQueue.hpp"
#include "parley/core/CancellationToken.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace parley {

struct Orchestrator::Impl {
    std::string session_id;
    PipelineConfig config;
    Collaborators collaborators;
    OutputSinks sinks;

    core::CancellationToken token;
    session::SessionContext context;
    core::BoundedQueue<Utterance> utterances;

    // Components
    std::unique_ptr<audio::FrameBuffer> frames;
    std::unique_ptr<audio::VoiceActivitySegmenter> segmenter;
    std::unique_ptr<stt::RecognitionDispatcher> dispatcher;
    std::unique_ptr<tts::SynthesisStreamer> streamer;
    std::unique_ptr<session::TurnManager> turns;

    // State
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::mutex audio_mutex;  // serializes pushAudio and close
    std::atomic<uint64_t> malformed{0};
    mutable std::mutex error_mutex;
    std::string last_error;

    Impl(std::string sid, const PipelineConfig& cfg, Collaborators collab, OutputSinks out)
        : session_id(std::move(sid))
        , config(cfg)
        , collaborators(std::move(collab))
        , sinks(std::move(out))
        , context(session_id, cfg.context)
        , utterances(cfg.queues.utterance_capacity)
    {
    }

    void setError(const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = message;
    }

    void emit(PipelineEvent&& event) {
        event.session_id = session_id;
        event.emitted_at = Clock::now();
        if (sinks.onEvent) {
            sinks.onEvent(event);
        }
    }

    void emitError(ErrorCode code, const std::string& message, uint64_t utterance_id = 0,
                   uint64_t turn_id = 0) {
        PipelineEvent event;
        event.type = EventType::Error;
        event.utterance_id = utterance_id;
        event.turn_id = turn_id;
        event.error = {code, message};
        emit(std::move(event));
    }

    bool initialize() {
        std::cout << "[Orchestrator] " << session_id << ": initializing components..." << std::endl;

        auto problems = validateConfig(config);
        if (!problems.empty()) {
            std::string message = "invalid config:";
            for (const auto& p : problems) {
                std::cerr << "[Orchestrator] " << session_id << ": " << p << std::endl;
                message += " " + p + ";";
            }
            setError(message);
            return false;
        }
        if (!collaborators.recognizer || !collaborators.generator || !collaborators.synthesizer) {
            setError("missing collaborator (recognizer, generator and synthesizer are required)");
            std::cerr << "[Orchestrator] " << session_id << ": " << last_error << std::endl;
            return false;
        }

        frames = std::make_unique<audio::FrameBuffer>(session_id, config.audio);

        std::unique_ptr<audio::SpeechDetector> detector = std::move(collaborators.detector);
        if (!detector) {
            detector = audio::makeDetector(config);
        }
        std::cout << "[Orchestrator] " << session_id << ": speech detector " << detector->name() << std::endl;

        audio::VoiceActivitySegmenter::Callbacks segmenter_callbacks;
        segmenter_callbacks.onSpeechStart = [this](uint64_t utterance_id, uint64_t) {
            PipelineEvent event;
            event.type = EventType::SpeechStarted;
            event.utterance_id = utterance_id;
            emit(std::move(event));
            turns->onSpeechStarted(utterance_id);
        };
        segmenter_callbacks.onUtteranceClosed = [this](const Utterance& utterance) {
            PipelineEvent event;
            event.type = EventType::UtteranceClosed;
            event.utterance_id = utterance.utterance_id;
            emit(std::move(event));
            turns->onUtteranceClosed(utterance.utterance_id);
        };
        segmenter_callbacks.onBackpressureDrop = [this](const Utterance& dropped) {
            emitError(ErrorCode::BackpressureDrop,
                      "utterance " + std::to_string(dropped.utterance_id) + " dropped, recognition queue full",
                      dropped.utterance_id);
            turns->onUtteranceDropped(dropped.utterance_id);
        };
        segmenter = std::make_unique<audio::VoiceActivitySegmenter>(
            session_id, config.vad, std::move(detector), utterances, std::move(segmenter_callbacks));

        stt::RecognitionDispatcher::Callbacks dispatcher_callbacks;
        dispatcher_callbacks.onTranscript = [this](TranscriptEvent&& event) {
            turns->onTranscript(std::move(event));
        };
        dispatcher_callbacks.onError = [this](uint64_t utterance_id, const PipelineError& error) {
            emitError(error.code, error.message, utterance_id);
        };
        dispatcher = std::make_unique<stt::RecognitionDispatcher>(
            session_id, config.recognition, collaborators.recognizer, utterances, context, token,
            std::move(dispatcher_callbacks));

        tts::SynthesisStreamer::Callbacks streamer_callbacks;
        streamer_callbacks.onChunk = [this](const SynthesisChunk& chunk) {
            if (sinks.onAudio) {
                sinks.onAudio(chunk);
            }
        };
        streamer_callbacks.onFirstAudio = [this](uint64_t turn_id) {
            turns->onFirstAudio(turn_id);
        };
        streamer_callbacks.onTurnDelivered = [this](uint64_t turn_id) {
            turns->onSynthesisDelivered(turn_id);
        };
        streamer_callbacks.onError = [this](uint64_t turn_id, const PipelineError& error) {
            emitError(error.code, error.message, 0, turn_id);
        };
        streamer = std::make_unique<tts::SynthesisStreamer>(
            session_id, config.synthesis, config.queues, collaborators.synthesizer, token,
            std::move(streamer_callbacks));

        turns = std::make_unique<session::TurnManager>(
            session_id, config, collaborators.generator, *streamer, context, token,
            [this](const PipelineEvent& event) {
                if (sinks.onEvent) {
                    sinks.onEvent(event);
                }
            });

        turns->start();
        streamer->start();
        dispatcher->start();

        std::cout << "[Orchestrator] " << session_id << ": all components started ("
                  << config.audio.sample_rate << "Hz, " << config.audio.channels << "ch, "
                  << config.audio.frame_ms << "ms frames)" << std::endl;
        return true;
    }

    PipelineError pushAudio(const uint8_t* data, size_t size) {
        std::lock_guard<std::mutex> lock(audio_mutex);
        if (closed || !started) {
            return {ErrorCode::SessionClosed, "session " + session_id + " is not open"};
        }
        context.touch();

        PipelineError error = frames->push(data, size, [this](AudioFrame&& frame) {
            segmenter->process(std::move(frame));
        });
        if (error) {
            ++malformed;
            emitError(error.code, error.message);
        }
        return error;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(audio_mutex);
            if (closed.exchange(true)) {
                return;
            }
        }
        if (!started) {
            return;
        }

        std::cout << "[Orchestrator] " << session_id << ": closing..." << std::endl;

        // Close the open utterance so none stays open past the session
        {
            std::lock_guard<std::mutex> lock(audio_mutex);
            segmenter->flush();
        }

        token.cancel();
        dispatcher->stop();
        turns->stop();
        streamer->stop();

        PipelineEvent event;
        event.type = EventType::SessionClosed;
        event.error = {ErrorCode::SessionClosed, "session closed"};
        emit(std::move(event));

        std::cout << "[Orchestrator] " << session_id << ": closed ("
                  << context.turnCount() << " turns in context)" << std::endl;
    }
};

Orchestrator::Orchestrator(std::string session_id,
                           const PipelineConfig& config,
                           Collaborators collaborators,
                           OutputSinks sinks)
    : impl_(std::make_unique<Impl>(std::move(session_id), config, std::move(collaborators),
                                   std::move(sinks)))
{
}

Orchestrator::~Orchestrator() {
    close();
}

bool Orchestrator::start() {
    if (impl_->started || impl_->closed) {
        return impl_->started && !impl_->closed;
    }
    if (!impl_->initialize()) {
        return false;
    }
    impl_->started = true;
    return true;
}

PipelineError Orchestrator::pushAudio(const uint8_t* data, size_t size) {
    return impl_->pushAudio(data, size);
}

void Orchestrator::close() { impl_->close(); }

bool Orchestrator::isOpen() const { return impl_->started && !impl_->closed; }

const std::string& Orchestrator::sessionId() const { return impl_->session_id; }

ConversationState Orchestrator::state() const {
    if (!impl_->turns) {
        return ConversationState::Idle;
    }
    return impl_->turns->state();
}

const session::SessionContext& Orchestrator::context() const { return impl_->context; }

OrchestratorStats Orchestrator::stats() const {
    OrchestratorStats s;
    s.malformed_payloads = impl_->malformed;
    if (impl_->segmenter) {
        std::lock_guard<std::mutex> lock(impl_->audio_mutex);
        s.frames = impl_->segmenter->framesProcessed();
        s.utterances = impl_->segmenter->utterancesClosed();
        s.utterances_dropped = impl_->segmenter->utterancesDropped();
    }
    if (impl_->dispatcher) s.recognition = impl_->dispatcher->stats();
    if (impl_->turns) s.turns = impl_->turns->stats();
    if (impl_->streamer) s.synthesis = impl_->streamer->stats();
    return s;
}

std::string Orchestrator::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error;
}

} // namespace parley
