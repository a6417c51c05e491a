/**
 * test_turn_manager.cpp - Turn-taking state machine tests
 *
 * Drives the TurnManager inputs directly, with a real SynthesisStreamer in
 * front of scripted generator and synthesizer fakes.
 */

#include "parley/session/TurnManager.hpp"
#include "support/FakeCollaborators.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace parley;
using namespace parley::testing;
using namespace std::chrono_literals;

namespace {

struct Harness {
    PipelineConfig config;
    std::shared_ptr<FakeGenerator> generator = std::make_shared<FakeGenerator>();
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>();
    EventRecorder recorder;
    core::CancellationToken token;
    std::unique_ptr<session::SessionContext> context;
    std::unique_ptr<tts::SynthesisStreamer> streamer;
    std::unique_ptr<session::TurnManager> turns;
    std::chrono::milliseconds sink_delay{0};   // event sink stall, on the state-machine thread

    Harness() {
        config.turn.end_of_turn_silence = 50ms;
        config.turn.tick = 5ms;
    }

    ~Harness() {
        token.cancel();
        if (turns) turns->stop();
        if (streamer) streamer->stop();
    }

    void start() {
        context = std::make_unique<session::SessionContext>("tm", config.context);

        tts::SynthesisStreamer::Callbacks callbacks;
        callbacks.onChunk = [this](const SynthesisChunk& chunk) { recorder.onChunk(chunk); };
        callbacks.onFirstAudio = [this](uint64_t turn_id) { turns->onFirstAudio(turn_id); };
        callbacks.onTurnDelivered = [this](uint64_t turn_id) { turns->onSynthesisDelivered(turn_id); };
        streamer = std::make_unique<tts::SynthesisStreamer>("tm", config.synthesis, config.queues,
                                                            synthesizer, token, std::move(callbacks));

        turns = std::make_unique<session::TurnManager>("tm", config, generator, *streamer, *context, token,
                                                       [this](const PipelineEvent& e) {
                                                           if (sink_delay.count() > 0) {
                                                               std::this_thread::sleep_for(sink_delay);
                                                           }
                                                           recorder.onEvent(e);
                                                       });
        turns->start();
        streamer->start();
    }

    // One utterance: speech start, final transcript, close
    void userSays(uint64_t utterance_id, const std::string& text) {
        turns->onSpeechStarted(utterance_id);
        TranscriptEvent event;
        event.session_id = "tm";
        event.utterance_id = utterance_id;
        event.text = text;
        event.is_final = true;
        event.confidence = 0.9f;
        turns->onTranscript(event);
        turns->onUtteranceClosed(utterance_id);
    }

    bool waitForAssistant(TurnState state, std::chrono::milliseconds timeout = 5s) {
        return recorder.waitForTurnState(Speaker::Assistant, state, timeout);
    }

    // Index in the recorder log of the first matching turn event
    size_t indexOf(Speaker speaker, TurnState state) const {
        auto log = recorder.log();
        for (size_t i = 0; i < log.size(); ++i) {
            const auto& e = log[i];
            if (!e.is_chunk && e.event.type == EventType::TurnStateChanged &&
                e.event.speaker == speaker && e.event.turn_state == state) {
                return i;
            }
        }
        return log.size();
    }
};

} // anonymous namespace

void test_single_exchange_state_order() {
    Harness h;
    h.start();

    h.userSays(1, "What's the weather like?");
    assert(h.waitForAssistant(TurnState::Completed));

    std::vector<ConversationState> expected = {
        ConversationState::Idle, ConversationState::UserSpeaking, ConversationState::UserTurnClosing,
        ConversationState::AssistantThinking, ConversationState::AssistantSpeaking, ConversationState::Idle};
    assert(h.recorder.conversationStates() == expected);

    // "Hello there." / "How can I help?" / empty final marker
    auto chunks = h.recorder.chunks();
    assert(chunks.size() == 3);
    for (size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].chunk_index == i);
        assert(chunks[i].is_final == (i == 2));
    }
    assert(chunks[0].text == "Hello there.");

    // Completion follows the last delivered chunk
    auto log = h.recorder.log();
    size_t completed = h.indexOf(Speaker::Assistant, TurnState::Completed);
    for (size_t i = completed; i < log.size(); ++i) {
        assert(!log[i].is_chunk);
    }

    assert(h.generator->calls == 1);
    assert(h.generator->lastUserText() == "What's the weather like?");
    assert(h.generator->lastContextSize() == 0);

    auto turns = h.context->snapshot();
    assert(turns->size() == 2);
    assert((*turns)[0].speaker == Speaker::User && (*turns)[0].state == TurnState::Completed);
    assert((*turns)[1].speaker == Speaker::Assistant);
    assert((*turns)[1].text == "Hello there. How can I help? ");
    assert(h.turns->state() == ConversationState::Idle);
    assert(!h.turns->activeAssistantTurn());

    auto stats = h.turns->stats();
    assert(stats.assistant_completed == 1);
    assert(stats.last_ttft && stats.last_ttfa);

    std::cout << "[PASS] test_single_exchange_state_order" << std::endl;
}

void test_utterances_join_into_one_turn() {
    Harness h;
    h.config.turn.end_of_turn_silence = 200ms;
    h.start();

    h.userSays(1, "Book a table");
    std::this_thread::sleep_for(50ms);
    h.userSays(2, "for two people.");
    assert(h.waitForAssistant(TurnState::Completed));

    assert(h.generator->calls == 1);
    assert(h.generator->lastUserText() == "Book a table for two people.");

    std::cout << "[PASS] test_utterances_join_into_one_turn" << std::endl;
}

void test_barge_in_stops_audio() {
    Harness h;
    h.generator->chunks = {"One. ", "Two. ", "Three. ", "Four. "};
    h.generator->hang_after_chunks = true;
    h.config.synthesis.concurrency = 1;
    h.synthesizer->delayFor("Two.", 10s);
    h.start();

    h.userSays(1, "Count to four.");

    // "One." delivered; "Two." held by the only worker; "Three." and "Four." queued
    assert(h.recorder.waitFor([&](const std::vector<EventRecorder::Entry>& log) {
        size_t delivered = 0;
        for (const auto& e : log) {
            if (e.is_chunk) ++delivered;
        }
        return delivered == 1 && h.synthesizer->calls == 2 && h.streamer->pendingChunks() == 3;
    }));
    auto assistant_turn = h.turns->activeAssistantTurn();
    assert(assistant_turn);
    assert(h.streamer->stats().discarded == 0);

    h.turns->onSpeechStarted(2);
    assert(h.waitForAssistant(TurnState::Cancelled));
    assert(h.recorder.waitForEvent([](const PipelineEvent& e) {
        return e.type == EventType::TurnStateChanged && e.speaker == Speaker::User &&
               e.turn_state == TurnState::UserSpeaking && e.from == ConversationState::AssistantSpeaking;
    }));

    // All three undelivered chunks are discarded, the in-flight one included
    assert(h.recorder.waitFor([&](const std::vector<EventRecorder::Entry>&) {
        return h.streamer->stats().discarded == 3 && h.synthesizer->cancellations_seen == 1;
    }, 2s));
    assert(h.synthesizer->calls == 2);
    std::this_thread::sleep_for(100ms);

    auto log = h.recorder.log();
    size_t cancelled = h.indexOf(Speaker::Assistant, TurnState::Cancelled);
    size_t reopened = h.indexOf(Speaker::User, TurnState::UserSpeaking);
    assert(cancelled < log.size());
    for (size_t i = cancelled; i < log.size(); ++i) {
        assert(!log[i].is_chunk);
    }
    // Cancelled is reported before the new user turn opens
    bool found_new_user_turn = false;
    for (size_t i = cancelled; i < log.size(); ++i) {
        const auto& e = log[i];
        if (!e.is_chunk && e.event.speaker == Speaker::User && e.event.turn_state == TurnState::UserSpeaking) {
            found_new_user_turn = true;
        }
    }
    assert(found_new_user_turn);
    assert(reopened < cancelled);  // first user turn opened earlier

    auto chunks = h.recorder.chunks();
    assert(chunks.size() == 1);
    assert(chunks[0].turn_id == *assistant_turn);
    assert(chunks[0].text == "One.");
    assert(h.streamer->stats().chunks_delivered == 1);
    assert(h.streamer->pendingChunks() == 0);

    assert(h.recorder.waitFor([&](const std::vector<EventRecorder::Entry>&) {
        return h.generator->cancellations_seen == 1;
    }, 2s));
    assert(h.turns->state() == ConversationState::UserSpeaking);
    assert(h.turns->stats().assistant_cancelled == 1);

    // The cancelled turn never enters the context
    assert(h.context->turnCount() == 1);

    std::cout << "[PASS] test_barge_in_stops_audio" << std::endl;
}

void test_barge_in_is_idempotent() {
    Harness h;
    h.generator->hang_after_chunks = true;
    h.synthesizer->delay = 100ms;
    h.start();

    h.userSays(1, "Tell me a story.");
    assert(h.waitForAssistant(TurnState::AssistantSpeaking));

    h.turns->onSpeechStarted(2);
    h.turns->onSpeechStarted(3);
    h.turns->onSpeechStarted(2);
    assert(h.waitForAssistant(TurnState::Cancelled));
    std::this_thread::sleep_for(200ms);

    size_t cancelled = 0;
    for (const auto& e : h.recorder.events(EventType::TurnStateChanged)) {
        if (e.speaker == Speaker::Assistant && e.turn_state == TurnState::Cancelled) {
            ++cancelled;
        }
    }
    assert(cancelled == 1);
    assert(h.turns->stats().assistant_cancelled == 1);
    assert(h.turns->state() == ConversationState::UserSpeaking);

    std::cout << "[PASS] test_barge_in_is_idempotent" << std::endl;
}

void test_generation_fails_mid_stream() {
    Harness h;
    h.generator->chunks = {"One. ", "Two. ", "Three. ", "Four. ", "Five. "};
    h.generator->fail_after = 2;
    h.config.generation.retry = core::RetryPolicy{2, 10ms, 2.0, 50ms};
    h.start();

    h.userSays(1, "Count to five.");
    assert(h.waitForAssistant(TurnState::Failed));
    std::this_thread::sleep_for(200ms);

    // Text already reached the synthesizer, so no retry
    assert(h.generator->calls == 1);

    auto log = h.recorder.log();
    size_t error = log.size(), unable = log.size(), failed = log.size();
    for (size_t i = 0; i < log.size(); ++i) {
        const auto& e = log[i];
        if (e.is_chunk) continue;
        if (e.event.type == EventType::Error && error == log.size()) error = i;
        if (e.event.type == EventType::UnableToRespond) unable = i;
        if (e.event.type == EventType::TurnStateChanged && e.event.turn_state == TurnState::Failed) failed = i;
    }
    assert(error < unable && unable < failed && failed < log.size());
    assert(log[error].event.error.code == ErrorCode::GenerationError);
    assert(log[unable].event.error.code == ErrorCode::GenerationError);
    assert(log[failed].event.to == ConversationState::Idle);

    for (size_t i = error; i < log.size(); ++i) {
        assert(!log[i].is_chunk);
    }

    auto turns = h.context->snapshot();
    assert(turns->size() == 1);
    assert(turns->front().speaker == Speaker::User);
    assert(h.turns->state() == ConversationState::Idle);
    assert(h.turns->stats().assistant_failed == 1);

    std::cout << "[PASS] test_generation_fails_mid_stream" << std::endl;
}

void test_generator_exception_fails_turn() {
    Harness h;
    h.generator->fail_after = 0;
    h.generator->throw_after_fail = true;
    h.start();

    h.userSays(1, "Hello?");
    assert(h.waitForAssistant(TurnState::Failed));
    auto errors = h.recorder.events(EventType::UnableToRespond);
    assert(errors.size() == 1);
    assert(errors[0].error.code == ErrorCode::GenerationError);
    assert(errors[0].error.message == "model crashed");

    std::cout << "[PASS] test_generator_exception_fails_turn" << std::endl;
}

void test_first_token_timeout_retried() {
    Harness h;
    h.generator->hang_before_first = true;
    h.config.generation.first_token_timeout = 100ms;
    h.config.generation.retry = core::RetryPolicy{1, 10ms, 2.0, 50ms};
    h.start();

    h.userSays(1, "Are you there?");
    assert(h.waitForAssistant(TurnState::Failed));

    assert(h.generator->calls == 2);
    auto errors = h.recorder.events(EventType::Error);
    assert(errors.size() == 1);
    assert(errors[0].error.code == ErrorCode::GenerationTimeout);
    assert(h.recorder.chunks().empty());
    assert(h.turns->state() == ConversationState::Idle);

    std::cout << "[PASS] test_first_token_timeout_retried" << std::endl;
}

void test_empty_user_turn() {
    Harness h;
    h.start();

    h.userSays(1, "   ");
    assert(h.recorder.waitForTurnState(Speaker::User, TurnState::Completed));
    std::this_thread::sleep_for(100ms);

    assert(h.generator->calls == 0);
    auto states = h.recorder.conversationStates();
    std::vector<ConversationState> expected = {ConversationState::Idle, ConversationState::UserSpeaking,
                                               ConversationState::UserTurnClosing, ConversationState::Idle};
    assert(states == expected);

    auto stats = h.turns->stats();
    assert(stats.degraded_user_turns == 1);
    auto turns = h.context->snapshot();
    assert(turns->size() == 1 && turns->front().degraded);

    std::cout << "[PASS] test_empty_user_turn" << std::endl;
}

void test_failed_recognition_marks_turn_degraded() {
    Harness h;
    h.start();

    h.userSays(1, "Play some jazz");
    h.turns->onSpeechStarted(2);
    TranscriptEvent failed;
    failed.session_id = "tm";
    failed.utterance_id = 2;
    failed.is_final = true;
    failed.error = ErrorCode::RecognitionTimeout;
    h.turns->onTranscript(failed);
    h.turns->onUtteranceClosed(2);

    assert(h.waitForAssistant(TurnState::Completed));
    assert(h.generator->lastUserText() == "Play some jazz");
    assert(h.context->snapshot()->front().degraded);

    auto finals = h.recorder.events(EventType::FinalTranscript);
    assert(finals.size() == 2);
    assert(finals[1].error.code == ErrorCode::RecognitionTimeout);

    std::cout << "[PASS] test_failed_recognition_marks_turn_degraded" << std::endl;
}

void test_queue_policy_defers_speech() {
    Harness h;
    h.config.turn.barge_in = BargeInPolicy::Queue;
    h.synthesizer->delay = 150ms;
    h.start();

    h.userSays(1, "First question.");
    assert(h.waitForAssistant(TurnState::AssistantSpeaking));

    h.userSays(2, "Second question.");
    assert(h.waitForAssistant(TurnState::Completed));

    // The deferred utterance becomes the next user turn once the assistant is done
    assert(h.recorder.waitFor([&](const std::vector<EventRecorder::Entry>&) {
        return h.generator->calls == 2;
    }));
    assert(h.recorder.waitFor([](const std::vector<EventRecorder::Entry>& log) {
        int completed = 0;
        for (const auto& e : log) {
            if (!e.is_chunk && e.event.speaker == Speaker::Assistant &&
                e.event.turn_state == TurnState::Completed) {
                ++completed;
            }
        }
        return completed == 2;
    }));

    assert(h.recorder.count(EventType::TurnStateChanged) > 0);
    for (const auto& e : h.recorder.events(EventType::TurnStateChanged)) {
        assert(e.turn_state != TurnState::Cancelled);
    }
    assert(h.generator->lastUserText() == "Second question.");
    assert(h.generator->lastContextSize() == 2);
    assert(h.context->turnCount() == 4);

    std::cout << "[PASS] test_queue_policy_defers_speech" << std::endl;
}

void test_grace_window_defers_speech() {
    Harness h;
    h.config.turn.barge_in_grace = 2000ms;
    h.generator->hang_after_chunks = true;
    h.synthesizer->delay = 50ms;
    h.start();

    h.userSays(1, "Hi.");
    assert(h.waitForAssistant(TurnState::AssistantSpeaking));
    h.turns->onSpeechStarted(2);
    std::this_thread::sleep_for(200ms);

    assert(!h.waitForAssistant(TurnState::Cancelled, 100ms));
    assert(h.turns->state() == ConversationState::AssistantSpeaking);

    std::cout << "[PASS] test_grace_window_defers_speech" << std::endl;
}

void test_late_inputs_discarded() {
    Harness h;
    h.start();

    // Transcript for an utterance that never started
    TranscriptEvent stray;
    stray.session_id = "tm";
    stray.utterance_id = 99;
    stray.text = "ghost";
    stray.is_final = true;
    h.turns->onTranscript(stray);
    h.turns->onFirstAudio(42);
    h.turns->onSynthesisDelivered(42);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (h.turns->stats().cancellation_races < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    assert(h.turns->stats().cancellation_races == 3);
    assert(h.recorder.events().empty());
    assert(h.turns->state() == ConversationState::Idle);

    std::cout << "[PASS] test_late_inputs_discarded" << std::endl;
}

void test_idle_context_ages_out() {
    Harness h;
    h.config.context.max_age = std::chrono::seconds(1);
    h.start();

    h.userSays(1, "Remember this.");
    assert(h.waitForAssistant(TurnState::Completed));
    assert(h.context->turnCount() == 2);

    // No further turns: the periodic sweep evicts them
    assert(h.recorder.waitFor([&](const std::vector<EventRecorder::Entry>&) {
        return h.context->turnCount() == 0;
    }, 4s));
    assert(h.turns->state() == ConversationState::Idle);

    std::cout << "[PASS] test_idle_context_ages_out" << std::endl;
}

void test_slow_sink_keeps_control_inputs() {
    Harness h;
    h.config.queues.turn_event_capacity = 1;
    h.sink_delay = 150ms;
    h.generator->chunks = {"One. ", "Two. ", "Three. "};
    h.start();

    h.userSays(1, "Count to three.");
    assert(h.waitForAssistant(TurnState::Completed, 15s));

    assert(h.turns->state() == ConversationState::Idle);
    auto stats = h.turns->stats();
    assert(stats.assistant_completed == 1);
    assert(stats.overflow_inputs > 0);
    assert(h.recorder.chunks().size() == 4);
    assert(h.context->turnCount() == 2);
    assert(h.context->snapshot()->back().text == "One. Two. Three. ");

    std::cout << "[PASS] test_slow_sink_keeps_control_inputs" << std::endl;
}

int main() {
    std::cout << "=== TurnManager Tests ===" << std::endl;

    test_single_exchange_state_order();
    test_utterances_join_into_one_turn();
    test_barge_in_stops_audio();
    test_barge_in_is_idempotent();
    test_generation_fails_mid_stream();
    test_generator_exception_fails_turn();
    test_first_token_timeout_retried();
    test_empty_user_turn();
    test_failed_recognition_marks_turn_degraded();
    test_queue_policy_defers_speech();
    test_grace_window_defers_speech();
    test_late_inputs_discarded();
    test_idle_context_ages_out();
    test_slow_sink_keeps_control_inputs();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
