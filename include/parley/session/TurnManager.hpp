/**
 * TurnManager.hpp - Conversation state machine and barge-in policy
 *
 * Runs on its own thread and consumes a single input queue fed by the
 * segmenter, the recognition dispatcher, the generation worker and the
 * synthesis streamer. It is the only writer of the SessionContext.
 *
 *   IDLE -> USER_SPEAKING -> USER_TURN_CLOSING -> ASSISTANT_THINKING
 *        -> ASSISTANT_SPEAKING -> IDLE
 *
 * Assistant turns end COMPLETED, CANCELLED (barge-in) or FAILED.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Events.hpp"
#include "parley/Types.hpp"
#include "parley/core/BoundedQueue.hpp"
#include "parley/core/CancellationToken.hpp"
#include "parley/llm/Generator.hpp"
#include "parley/session/SessionContext.hpp"
#include "parley/tts/SynthesisStreamer.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace parley::session {

class TurnManager {
public:
    struct Stats {
        uint64_t user_turns = 0;
        uint64_t degraded_user_turns = 0;
        uint64_t assistant_completed = 0;
        uint64_t assistant_cancelled = 0;
        uint64_t assistant_failed = 0;
        uint64_t cancellation_races = 0;   // late inputs discarded
        uint64_t dropped_inputs = 0;       // latency samples shed, input queue full
        uint64_t overflow_inputs = 0;      // control inputs queued past capacity
        std::optional<std::chrono::milliseconds> last_ttft;   // turn closed -> first LLM chunk
        std::optional<std::chrono::milliseconds> last_ttfa;   // turn closed -> first audio
        double avg_ttfa_ms = 0.0;
    };

    TurnManager(std::string session_id,
                const PipelineConfig& config,
                std::shared_ptr<llm::Generator> generator,
                tts::SynthesisStreamer& streamer,
                SessionContext& context,
                core::CancellationToken session_token,
                EventCallback on_event);
    ~TurnManager();

    TurnManager(const TurnManager&) = delete;
    TurnManager& operator=(const TurnManager&) = delete;

    void start();

    /**
     * Cancel any open assistant turn and stop the state-machine thread.
     */
    void stop();

    // --- Inputs (thread-safe, never block for long) ------------------------

    void onSpeechStarted(uint64_t utterance_id);
    void onUtteranceClosed(uint64_t utterance_id);
    void onUtteranceDropped(uint64_t utterance_id);
    void onTranscript(TranscriptEvent event);
    void onFirstAudio(uint64_t turn_id);
    void onSynthesisDelivered(uint64_t turn_id);

    // --- Observers ---------------------------------------------------------

    ConversationState state() const { return state_.load(); }
    std::optional<uint64_t> activeAssistantTurn() const;
    Stats stats() const;

private:
    struct SpeechStarted { uint64_t utterance_id; TimePoint at; };
    struct UtteranceClosed { uint64_t utterance_id; TimePoint at; };
    struct UtteranceDropped { uint64_t utterance_id; };
    struct Transcript { TranscriptEvent event; };
    struct GenerationChunk { uint64_t turn_id; std::string text; bool first; TimePoint at; };
    struct GenerationDone { uint64_t turn_id; ErrorCode error; std::string message; };
    struct FirstAudio { uint64_t turn_id; TimePoint at; };
    struct SynthesisDelivered { uint64_t turn_id; };

    using Input = std::variant<SpeechStarted, UtteranceClosed, UtteranceDropped, Transcript,
                               GenerationChunk, GenerationDone, FirstAudio, SynthesisDelivered>;

    // Per-utterance bookkeeping for the user turn being assembled
    struct UtteranceTrack {
        bool closed = false;
        bool finalized = false;
        bool heard = false;   // at least one transcript arrived
        bool failed = false;
        std::string text;
    };

    // Shared between the state machine and one generation worker
    struct GenerationRun {
        uint64_t turn_id = 0;
        core::CancellationToken token;
        std::mutex mutex;
        core::CancellationToken attempt_token;
        int attempt = 0;
        TimePoint attempt_started;
        bool in_attempt = false;
        bool first_chunk = false;
        bool timed_out = false;
        std::atomic<bool> done{false};
        std::thread thread;
    };

    static constexpr std::chrono::seconds kExpiryInterval{1};

    void post(Input&& input);
    void run();
    void handle(Input& input);
    void tick(TimePoint now);

    void handleSpeechStarted(const SpeechStarted& in);
    void handleUtteranceClosed(const UtteranceClosed& in);
    void handleUtteranceDropped(const UtteranceDropped& in);
    void handleTranscript(Transcript& in);
    void handleGenerationChunk(const GenerationChunk& in);
    void handleGenerationDone(const GenerationDone& in);
    void handleFirstAudio(const FirstAudio& in);
    void handleSynthesisDelivered(const SynthesisDelivered& in);

    void openUserTurn(ConversationState from);
    bool userTurnReady(TimePoint now) const;
    void closeUserTurn();
    void startGeneration(const Turn& user_turn,
                         std::shared_ptr<const SessionContext::TurnList> history);
    void generationWorker(std::shared_ptr<GenerationRun> run,
                          std::shared_ptr<const SessionContext::TurnList> history,
                          std::string user_text);
    void bargeIn(uint64_t utterance_id, TimePoint now);
    void cancelAssistant(ConversationState to);
    void failAssistant(ErrorCode code, const std::string& message);
    void completeAssistant();
    void finishAssistant(ConversationState from);
    void resumePending();
    void retireGeneration();
    void reapGenerations(bool wait);

    bool setTurnState(Turn& turn, TurnState next);
    void emitTurnChange(const Turn& turn, ConversationState from, ConversationState to);
    void emit(PipelineEvent&& event);
    void discardLate(const char* what, uint64_t id);

    std::string session_id_;
    TurnConfig turn_config_;
    GenerationConfig generation_config_;
    bool verbose_;
    std::shared_ptr<llm::Generator> generator_;
    tts::SynthesisStreamer& streamer_;
    SessionContext& context_;
    core::CancellationToken session_token_;
    EventCallback on_event_;

    core::BoundedQueue<Input> inputs_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<ConversationState> state_{ConversationState::Idle};

    // State-machine thread only
    uint64_t next_turn_id_ = 1;
    std::optional<Turn> user_turn_;
    std::optional<Turn> assistant_turn_;
    std::map<uint64_t, UtteranceTrack> utterances_;
    std::optional<TimePoint> last_close_;
    TimePoint closed_at_;   // user turn closed, latency origin
    bool generation_done_ = false;
    bool synthesis_delivered_ = false;
    std::shared_ptr<GenerationRun> generation_;
    TimePoint last_expiry_{};
    std::vector<std::shared_ptr<GenerationRun>> retired_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    double ttfa_total_ms_ = 0.0;
    uint64_t ttfa_samples_ = 0;
    std::atomic<uint64_t> active_assistant_{0};
};

} // namespace parley::session
