/**
 * TurnManager.cpp - Turn-taking state machine
 */

#include "parley/session/TurnManager.hpp"

#include <cctype>
#include <iostream>

namespace parley::session {

namespace {

bool hasText(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

long long millisBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // anonymous namespace

TurnManager::TurnManager(std::string session_id,
                         const PipelineConfig& config,
                         std::shared_ptr<llm::Generator> generator,
                         tts::SynthesisStreamer& streamer,
                         SessionContext& context,
                         core::CancellationToken session_token,
                         EventCallback on_event)
    : session_id_(std::move(session_id))
    , turn_config_(config.turn)
    , generation_config_(config.generation)
    , verbose_(config.log.verbose)
    , generator_(std::move(generator))
    , streamer_(streamer)
    , context_(context)
    , session_token_(std::move(session_token))
    , on_event_(std::move(on_event))
    , inputs_(config.queues.turn_event_capacity)
{
}

TurnManager::~TurnManager() {
    stop();
}

void TurnManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
    std::cout << "[TurnManager] " << session_id_ << ": started (end-of-turn="
              << turn_config_.end_of_turn_silence.count() << "ms, barge-in="
              << (turn_config_.barge_in == BargeInPolicy::Interrupt ? "interrupt" : "queue")
              << ", grace=" << turn_config_.barge_in_grace.count() << "ms)" << std::endl;
}

void TurnManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    inputs_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

// ============================================================================
// Inputs
// ============================================================================

void TurnManager::onSpeechStarted(uint64_t utterance_id) {
    post(SpeechStarted{utterance_id, Clock::now()});
}

void TurnManager::onUtteranceClosed(uint64_t utterance_id) {
    post(UtteranceClosed{utterance_id, Clock::now()});
}

void TurnManager::onUtteranceDropped(uint64_t utterance_id) {
    post(UtteranceDropped{utterance_id});
}

void TurnManager::onTranscript(TranscriptEvent event) {
    post(Transcript{std::move(event)});
}

void TurnManager::onFirstAudio(uint64_t turn_id) {
    post(FirstAudio{turn_id, Clock::now()});
}

void TurnManager::onSynthesisDelivered(uint64_t turn_id) {
    post(SynthesisDelivered{turn_id});
}

void TurnManager::post(Input&& input) {
    if (inputs_.pushFor(std::move(input), std::chrono::milliseconds(100))) {
        return;
    }

    // A first-audio notice only carries a latency sample and may be shed.
    // Every other input moves a turn forward and is queued past capacity.
    if (std::holds_alternative<FirstAudio>(input)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.dropped_inputs;
        if (verbose_) {
            std::cerr << "[TurnManager] " << session_id_ << ": input queue full, dropping latency sample"
                      << std::endl;
        }
        return;
    }
    if (!inputs_.forcePush(std::move(input))) {
        return;  // stopped
    }
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.overflow_inputs;
    if (stats_.overflow_inputs == 1 || verbose_) {
        std::cerr << "[TurnManager] " << session_id_ << ": input queue full, queued past capacity ("
                  << inputs_.size() << "/" << inputs_.capacity() << ")" << std::endl;
    }
}

std::optional<uint64_t> TurnManager::activeAssistantTurn() const {
    uint64_t id = active_assistant_.load();
    if (id == 0) {
        return std::nullopt;
    }
    return id;
}

TurnManager::Stats TurnManager::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// Main loop
// ============================================================================

void TurnManager::run() {
    while (true) {
        auto input = inputs_.popFor(turn_config_.tick);
        if (input) {
            handle(*input);
        } else if (inputs_.closed()) {
            break;
        }
        tick(Clock::now());
    }

    if (assistant_turn_) {
        cancelAssistant(ConversationState::Idle);
    }
    reapGenerations(true);
}

void TurnManager::handle(Input& input) {
    if (auto* in = std::get_if<SpeechStarted>(&input)) {
        handleSpeechStarted(*in);
    } else if (auto* in = std::get_if<UtteranceClosed>(&input)) {
        handleUtteranceClosed(*in);
    } else if (auto* in = std::get_if<UtteranceDropped>(&input)) {
        handleUtteranceDropped(*in);
    } else if (auto* in = std::get_if<Transcript>(&input)) {
        handleTranscript(*in);
    } else if (auto* in = std::get_if<GenerationChunk>(&input)) {
        handleGenerationChunk(*in);
    } else if (auto* in = std::get_if<GenerationDone>(&input)) {
        handleGenerationDone(*in);
    } else if (auto* in = std::get_if<FirstAudio>(&input)) {
        handleFirstAudio(*in);
    } else if (auto* in = std::get_if<SynthesisDelivered>(&input)) {
        handleSynthesisDelivered(*in);
    }
}

void TurnManager::tick(TimePoint now) {
    switch (state_.load()) {
        case ConversationState::UserSpeaking:
            if (userTurnReady(now)) {
                closeUserTurn();
            }
            break;

        case ConversationState::AssistantThinking:
            if (generation_) {
                std::lock_guard<std::mutex> lock(generation_->mutex);
                if (generation_->in_attempt && !generation_->first_chunk && !generation_->timed_out &&
                    now - generation_->attempt_started >= generation_config_.first_token_timeout) {
                    generation_->timed_out = true;
                    generation_->attempt_token.cancel();
                    std::cerr << "[TurnManager] " << session_id_ << ": turn " << generation_->turn_id
                              << " attempt " << generation_->attempt << " no first token after "
                              << generation_config_.first_token_timeout.count() << "ms" << std::endl;
                }
            }
            break;

        default:
            break;
    }

    // Age-based retention also applies while the session is quiet
    if (now - last_expiry_ >= kExpiryInterval) {
        last_expiry_ = now;
        context_.expire(now);
    }
    reapGenerations(false);
}

// ============================================================================
// Input handlers
// ============================================================================

void TurnManager::handleSpeechStarted(const SpeechStarted& in) {
    utterances_[in.utterance_id];
    context_.touch();

    ConversationState current = state_.load();
    if (current == ConversationState::AssistantThinking ||
        current == ConversationState::AssistantSpeaking) {
        bargeIn(in.utterance_id, in.at);
    }
}

void TurnManager::handleUtteranceClosed(const UtteranceClosed& in) {
    auto it = utterances_.find(in.utterance_id);
    if (it == utterances_.end()) {
        discardLate("utterance close", in.utterance_id);
        return;
    }
    it->second.closed = true;
    last_close_ = in.at;
}

void TurnManager::handleUtteranceDropped(const UtteranceDropped& in) {
    auto it = utterances_.find(in.utterance_id);
    if (it == utterances_.end()) {
        return;
    }
    if (!it->second.heard && state_.load() != ConversationState::UserSpeaking) {
        utterances_.erase(it);
        return;
    }
    // Counts as an empty final so the turn does not wait for it
    it->second.closed = true;
    it->second.finalized = true;
    it->second.failed = true;
}

void TurnManager::handleTranscript(Transcript& in) {
    TranscriptEvent& event = in.event;
    auto it = utterances_.find(event.utterance_id);
    if (it == utterances_.end() || it->second.finalized) {
        discardLate("transcript", event.utterance_id);
        return;
    }

    if (event.speaker_tag) {
        event.speaker_label = context_.assignSpeakerLabel(*event.speaker_tag);
    }

    UtteranceTrack& track = it->second;
    track.heard = true;
    if (event.is_final) {
        track.finalized = true;
        track.failed = event.failed();
        track.text = event.text;
    }

    PipelineEvent out;
    out.type = event.is_final ? EventType::FinalTranscript : EventType::PartialTranscript;
    out.utterance_id = event.utterance_id;
    out.transcript = event;
    if (event.failed()) {
        out.error = {event.error, "recognition failed"};
    }
    emit(std::move(out));

    if (state_.load() == ConversationState::Idle) {
        openUserTurn(ConversationState::Idle);
    }
}

void TurnManager::handleGenerationChunk(const GenerationChunk& in) {
    if (!assistant_turn_ || assistant_turn_->turn_id != in.turn_id) {
        discardLate("generation chunk", in.turn_id);
        return;
    }
    assistant_turn_->text += in.text;

    if (in.first && state_.load() == ConversationState::AssistantThinking) {
        auto ttft = std::chrono::duration_cast<std::chrono::milliseconds>(in.at - closed_at_);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.last_ttft = ttft;
        }
        setTurnState(*assistant_turn_, TurnState::AssistantSpeaking);
        state_ = ConversationState::AssistantSpeaking;
        emitTurnChange(*assistant_turn_, ConversationState::AssistantThinking,
                       ConversationState::AssistantSpeaking);
        if (verbose_) {
            std::cout << "[TurnManager] " << session_id_ << ": turn " << in.turn_id
                      << " first token after " << ttft.count() << "ms" << std::endl;
        }
    }
}

void TurnManager::handleGenerationDone(const GenerationDone& in) {
    if (!assistant_turn_ || assistant_turn_->turn_id != in.turn_id) {
        discardLate("generation result", in.turn_id);
        return;
    }
    if (in.error != ErrorCode::None) {
        failAssistant(in.error, in.message);
        return;
    }
    generation_done_ = true;
    if (synthesis_delivered_) {
        completeAssistant();
    }
}

void TurnManager::handleFirstAudio(const FirstAudio& in) {
    if (!assistant_turn_ || assistant_turn_->turn_id != in.turn_id) {
        discardLate("first audio", in.turn_id);
        return;
    }
    auto ttfa = std::chrono::duration_cast<std::chrono::milliseconds>(in.at - closed_at_);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.last_ttfa = ttfa;
    ttfa_total_ms_ += static_cast<double>(ttfa.count());
    ++ttfa_samples_;
    stats_.avg_ttfa_ms = ttfa_total_ms_ / static_cast<double>(ttfa_samples_);
}

void TurnManager::handleSynthesisDelivered(const SynthesisDelivered& in) {
    if (!assistant_turn_ || assistant_turn_->turn_id != in.turn_id) {
        discardLate("synthesis completion", in.turn_id);
        return;
    }
    synthesis_delivered_ = true;
    if (generation_done_) {
        completeAssistant();
    }
}

// ============================================================================
// User turns
// ============================================================================

void TurnManager::openUserTurn(ConversationState from) {
    Turn turn;
    turn.session_id = session_id_;
    turn.turn_id = next_turn_id_++;
    turn.speaker = Speaker::User;
    turn.state = TurnState::UserSpeaking;
    turn.started_at = Clock::now();
    user_turn_ = turn;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.user_turns;
    }
    state_ = ConversationState::UserSpeaking;
    emitTurnChange(*user_turn_, from, ConversationState::UserSpeaking);
}

bool TurnManager::userTurnReady(TimePoint now) const {
    if (!user_turn_ || utterances_.empty() || !last_close_) {
        return false;
    }
    for (const auto& [id, track] : utterances_) {
        if (!track.closed || !track.finalized) {
            return false;
        }
    }
    return now - *last_close_ >= turn_config_.end_of_turn_silence;
}

void TurnManager::closeUserTurn() {
    setTurnState(*user_turn_, TurnState::UserTurnClosing);
    state_ = ConversationState::UserTurnClosing;
    emitTurnChange(*user_turn_, ConversationState::UserSpeaking, ConversationState::UserTurnClosing);

    // Utterance ids increase with capture order
    std::string text;
    bool degraded = false;
    for (const auto& [id, track] : utterances_) {
        if (track.failed) {
            degraded = true;
        }
        if (!hasText(track.text)) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += track.text;
    }
    utterances_.clear();
    last_close_.reset();
    closed_at_ = Clock::now();

    user_turn_->text = text;
    user_turn_->degraded = degraded || text.empty();

    auto history = context_.snapshot();
    setTurnState(*user_turn_, TurnState::Completed);
    context_.appendTurn(*user_turn_);

    if (user_turn_->degraded) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.degraded_user_turns;
    }

    Turn done = *user_turn_;
    user_turn_.reset();

    if (text.empty()) {
        std::cerr << "[TurnManager] " << session_id_ << ": user turn " << done.turn_id
                  << " has no usable text, not generating" << std::endl;
        state_ = ConversationState::Idle;
        emitTurnChange(done, ConversationState::UserTurnClosing, ConversationState::Idle);
        resumePending();
        return;
    }

    std::cout << "[TurnManager] " << session_id_ << ": user turn " << done.turn_id << ": \""
              << text << "\"" << (done.degraded ? " (degraded)" : "") << std::endl;
    startGeneration(done, std::move(history));
}

// ============================================================================
// Assistant turns
// ============================================================================

void TurnManager::startGeneration(const Turn& user_turn,
                                  std::shared_ptr<const SessionContext::TurnList> history) {
    Turn turn;
    turn.session_id = session_id_;
    turn.turn_id = next_turn_id_++;
    turn.speaker = Speaker::Assistant;
    turn.state = TurnState::AssistantThinking;
    turn.started_at = Clock::now();
    assistant_turn_ = turn;
    active_assistant_ = turn.turn_id;
    generation_done_ = false;
    synthesis_delivered_ = false;

    state_ = ConversationState::AssistantThinking;
    emitTurnChange(user_turn, ConversationState::UserTurnClosing, ConversationState::AssistantThinking);
    emitTurnChange(*assistant_turn_, ConversationState::UserTurnClosing,
                   ConversationState::AssistantThinking);

    streamer_.begin(turn.turn_id);

    auto run = std::make_shared<GenerationRun>();
    run->turn_id = turn.turn_id;
    run->token = session_token_.child();
    generation_ = run;
    run->thread = std::thread([this, run, history, text = user_turn.text]() {
        generationWorker(run, history, text);
    });
}

void TurnManager::generationWorker(std::shared_ptr<GenerationRun> run,
                                   std::shared_ptr<const SessionContext::TurnList> history,
                                   std::string user_text) {
    const uint64_t turn_id = run->turn_id;

    auto attempt_fn = [&](int attempt) -> llm::GenerationResult {
        core::CancellationToken attempt_token;
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->attempt = attempt;
            run->attempt_token = run->token.child();
            run->attempt_started = Clock::now();
            run->in_attempt = true;
            run->timed_out = false;
            attempt_token = run->attempt_token;
        }

        bool any_text = false;
        llm::TextChunkCallback on_chunk = [&](const std::string& chunk) {
            if (attempt_token.isCancelled()) {
                return false;
            }
            bool first = false;
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                if (run->timed_out) {
                    return false;
                }
                if (!run->first_chunk) {
                    run->first_chunk = true;
                    first = true;
                }
            }
            if (hasText(chunk)) {
                any_text = true;
            }
            post(GenerationChunk{turn_id, chunk, first, Clock::now()});
            return streamer_.feed(turn_id, chunk);
        };

        llm::GenerationResult result;
        try {
            result = generator_->generate(*history, user_text, on_chunk, attempt_token);
        } catch (const std::exception& e) {
            result.error = ErrorCode::GenerationError;
            result.error_message = e.what();
        } catch (...) {
            result.error = ErrorCode::GenerationError;
            result.error_message = "unknown exception";
        }

        bool timed_out = false;
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->in_attempt = false;
            timed_out = run->timed_out;
        }

        if (timed_out) {
            result.error = ErrorCode::GenerationTimeout;
            result.error_message = "no first token after " +
                                   std::to_string(generation_config_.first_token_timeout.count()) + "ms";
        } else if (run->token.isCancelled()) {
            result.error = ErrorCode::CancellationRace;
            result.error_message = "turn cancelled";
        } else if (result.error == ErrorCode::None && !any_text) {
            result.error = ErrorCode::GenerationError;
            result.error_message = "empty response";
        }
        return result;
    };

    // Once text has reached the synthesizer the turn can no longer be retried
    auto retryable = [&](const llm::GenerationResult& result) {
        std::lock_guard<std::mutex> lock(run->mutex);
        return !run->first_chunk && core::RetryPolicy::isRetryable(result.error);
    };

    auto on_failure = [&](int attempt, const llm::GenerationResult& result) {
        std::cerr << "[TurnManager] " << session_id_ << ": turn " << turn_id << " generation attempt "
                  << attempt << "/" << generation_config_.retry.maxAttempts() << " failed: "
                  << toString(result.error) << " (" << result.error_message << ")" << std::endl;
    };

    llm::GenerationResult result =
        generation_config_.retry.executeIf(attempt_fn, retryable, run->token, on_failure);

    if (result.error == ErrorCode::None && !streamer_.finish(turn_id) && verbose_) {
        std::cout << "[TurnManager] " << session_id_ << ": turn " << turn_id
                  << " no longer active at end of generation" << std::endl;
    }

    post(GenerationDone{turn_id, result.error, result.error_message});
    run->done = true;
}

void TurnManager::bargeIn(uint64_t utterance_id, TimePoint now) {
    if (!assistant_turn_) {
        return;
    }

    bool in_grace = now - assistant_turn_->started_at < turn_config_.barge_in_grace;
    if (turn_config_.barge_in == BargeInPolicy::Queue || in_grace) {
        std::cout << "[TurnManager] " << session_id_ << ": speech during assistant turn "
                  << assistant_turn_->turn_id << " deferred (utterance " << utterance_id
                  << (in_grace ? ", grace window" : ", queue policy") << ")" << std::endl;
        return;
    }

    std::cout << "[TurnManager] " << session_id_ << ": barge-in on assistant turn "
              << assistant_turn_->turn_id << " by utterance " << utterance_id << std::endl;

    ConversationState from = state_.load();
    cancelAssistant(ConversationState::UserSpeaking);
    openUserTurn(from);
}

void TurnManager::cancelAssistant(ConversationState to) {
    const uint64_t turn_id = assistant_turn_->turn_id;
    const ConversationState from = state_.load();

    // Both acknowledgments: the generation token is cancelled and the
    // streamer has stopped delivering for this turn when cancel() returns.
    retireGeneration();
    streamer_.cancel(turn_id);

    setTurnState(*assistant_turn_, TurnState::Cancelled);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.assistant_cancelled;
    }
    state_ = to;
    emitTurnChange(*assistant_turn_, from, to);
    assistant_turn_.reset();
    active_assistant_ = 0;
}

void TurnManager::failAssistant(ErrorCode code, const std::string& message) {
    const uint64_t turn_id = assistant_turn_->turn_id;
    const ConversationState from = state_.load();

    retireGeneration();
    streamer_.cancel(turn_id);

    std::cerr << "[TurnManager] " << session_id_ << ": assistant turn " << turn_id << " failed: "
              << toString(code) << " (" << message << ")" << std::endl;

    setTurnState(*assistant_turn_, TurnState::Failed);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.assistant_failed;
    }

    PipelineEvent error;
    error.type = EventType::Error;
    error.turn_id = turn_id;
    error.speaker = Speaker::Assistant;
    error.error = {code, message};
    emit(std::move(error));

    PipelineEvent unable;
    unable.type = EventType::UnableToRespond;
    unable.turn_id = turn_id;
    unable.speaker = Speaker::Assistant;
    unable.error = {code, message};
    emit(std::move(unable));

    finishAssistant(from);
}

void TurnManager::completeAssistant() {
    setTurnState(*assistant_turn_, TurnState::Completed);
    context_.appendTurn(*assistant_turn_);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.assistant_completed;
    }
    std::cout << "[TurnManager] " << session_id_ << ": assistant turn " << assistant_turn_->turn_id
              << " completed in " << millisBetween(assistant_turn_->started_at, Clock::now())
              << "ms" << std::endl;
    retireGeneration();
    finishAssistant(state_.load());
}

void TurnManager::finishAssistant(ConversationState from) {
    state_ = ConversationState::Idle;
    emitTurnChange(*assistant_turn_, from, ConversationState::Idle);
    assistant_turn_.reset();
    active_assistant_ = 0;
    resumePending();
}

// Speech deferred during the assistant turn becomes the next user turn
void TurnManager::resumePending() {
    for (const auto& [id, track] : utterances_) {
        if (track.heard) {
            openUserTurn(ConversationState::Idle);
            return;
        }
    }
}

void TurnManager::retireGeneration() {
    if (!generation_) {
        return;
    }
    generation_->token.cancel();
    retired_.push_back(std::move(generation_));
    generation_.reset();
}

void TurnManager::reapGenerations(bool wait) {
    for (auto it = retired_.begin(); it != retired_.end();) {
        if (wait || (*it)->done) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

bool TurnManager::setTurnState(Turn& turn, TurnState next) {
    if (!canTransition(turn.state, next)) {
        std::cerr << "[TurnManager] " << session_id_ << ": illegal transition of turn " << turn.turn_id
                  << " from " << toString(turn.state) << " to " << toString(next) << std::endl;
        return false;
    }
    turn.state = next;
    if (turn.isTerminal()) {
        turn.ended_at = Clock::now();
    }
    return true;
}

void TurnManager::emitTurnChange(const Turn& turn, ConversationState from, ConversationState to) {
    if (verbose_) {
        std::cout << "[TurnManager] " << session_id_ << ": " << toString(from) << " -> "
                  << toString(to) << " (" << toString(turn.speaker) << " turn " << turn.turn_id
                  << " " << toString(turn.state) << ")" << std::endl;
    }
    PipelineEvent event;
    event.type = EventType::TurnStateChanged;
    event.turn_id = turn.turn_id;
    event.speaker = turn.speaker;
    event.from = from;
    event.to = to;
    event.turn_state = turn.state;
    emit(std::move(event));
}

void TurnManager::emit(PipelineEvent&& event) {
    event.session_id = session_id_;
    event.emitted_at = Clock::now();
    if (on_event_) {
        on_event_(event);
    }
}

void TurnManager::discardLate(const char* what, uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.cancellation_races;
    }
    if (verbose_) {
        std::cout << "[TurnManager] " << session_id_ << ": discarding late " << what << " for "
                  << id << " (" << toString(ErrorCode::CancellationRace) << ")" << std::endl;
    }
}

} // namespace parley::session
