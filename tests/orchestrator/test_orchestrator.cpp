/**
 * test_orchestrator.cpp - Orchestrator Integration Tests
 *
 * Raw PCM in, events and ordered audio chunks out, with scripted
 * recognizer, generator and synthesizer.
 */

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "parley/Orchestrator.hpp"
#include "support/FakeCollaborators.hpp"

using namespace parley;
using namespace parley::testing;
using namespace std::chrono_literals;

namespace {

struct Session {
    PipelineConfig config;
    std::shared_ptr<FakeRecognizer> recognizer = std::make_shared<FakeRecognizer>();
    std::shared_ptr<FakeGenerator> generator = std::make_shared<FakeGenerator>();
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>();
    EventRecorder recorder;
    std::unique_ptr<Orchestrator> orchestrator;

    Session() {
        config.turn.end_of_turn_silence = 100ms;
    }

    bool start() {
        Collaborators c;
        c.recognizer = recognizer;
        c.generator = generator;
        c.synthesizer = synthesizer;
        orchestrator = std::make_unique<Orchestrator>("orch", config, std::move(c), recorder.sinks());
        return orchestrator->start();
    }

    void push(int ms, bool voiced) {
        auto bytes = pcmBytes(config.audio.sample_rate, ms, voiced);
        // Transport-sized payloads of 100 ms
        const size_t step = static_cast<size_t>(config.audio.sample_rate) / 10 * 2;
        for (size_t offset = 0; offset < bytes.size(); offset += step) {
            size_t n = std::min(step, bytes.size() - offset);
            auto err = orchestrator->pushAudio(bytes.data() + offset, n);
            assert(!err);
        }
    }
};

} // anonymous namespace

void testSpeechToSpeech() {
    std::cout << "\n--- Test: 2 s Speech + 1 s Silence ---\n";

    Session s;
    s.recognizer->setDefault({FakeRecognizer::Mode::Text, "Turn on the lights.", {"Turn on"}, std::nullopt, 0ms});
    assert(s.start());

    s.push(2000, true);
    s.push(1000, false);

    assert(s.recorder.waitForTurnState(Speaker::Assistant, TurnState::Completed));

    assert(s.recorder.count(EventType::SpeechStarted) == 1);
    assert(s.recorder.count(EventType::UtteranceClosed) == 1);
    assert(s.recorder.count(EventType::PartialTranscript) == 1);
    auto finals = s.recorder.events(EventType::FinalTranscript);
    assert(finals.size() == 1);
    assert(finals[0].transcript->text == "Turn on the lights.");
    assert(s.recorder.count(EventType::Error) == 0);

    std::vector<ConversationState> expected = {
        ConversationState::Idle, ConversationState::UserSpeaking, ConversationState::UserTurnClosing,
        ConversationState::AssistantThinking, ConversationState::AssistantSpeaking, ConversationState::Idle};
    assert(s.recorder.conversationStates() == expected);

    auto chunks = s.recorder.chunks();
    assert(chunks.size() == 3);
    for (size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].chunk_index == i);
    }
    assert(chunks.back().is_final);

    assert(s.generator->lastUserText() == "Turn on the lights.");
    assert(s.orchestrator->context().turnCount() == 2);

    auto stats = s.orchestrator->stats();
    assert(stats.frames == 150);
    assert(stats.utterances == 1);
    assert(stats.recognition.recognized == 1);
    assert(stats.turns.assistant_completed == 1);
    assert(stats.synthesis.chunks_delivered == 3);

    std::cout << "[PASS] Speech to speech in order\n";
}

void testMalformedPayload() {
    std::cout << "\n--- Test: Malformed Payload ---\n";

    Session s;
    s.config.audio.max_payload_bytes = 8000;
    assert(s.start());

    std::vector<uint8_t> odd(333, 0);
    auto err = s.orchestrator->pushAudio(odd.data(), odd.size());
    assert(err.code == ErrorCode::MalformedAudio);

    std::vector<uint8_t> huge(16000, 0);
    err = s.orchestrator->pushAudio(huge.data(), huge.size());
    assert(err.code == ErrorCode::MalformedAudio);

    auto errors = s.recorder.events(EventType::Error);
    assert(errors.size() == 2);
    assert(errors[0].error.code == ErrorCode::MalformedAudio);

    // The session keeps going
    assert(s.orchestrator->isOpen());
    s.push(1000, true);
    s.push(800, false);
    assert(s.recorder.waitForTurnState(Speaker::Assistant, TurnState::Completed));
    assert(s.orchestrator->stats().malformed_payloads == 2);

    std::cout << "[PASS] Malformed payloads reported, session continues\n";
}

void testRecognitionTimesOutTwice() {
    std::cout << "\n--- Test: Recognition Times Out Twice ---\n";

    Session s;
    s.recognizer->setDefault({FakeRecognizer::Mode::Hang, "", {}, std::nullopt, 0ms});
    s.config.recognition.timeout = 100ms;
    s.config.recognition.retry = core::RetryPolicy{1, 10ms, 2.0, 50ms};
    assert(s.start());

    s.push(1000, true);
    s.push(800, false);

    assert(s.recorder.waitForTurnState(Speaker::User, TurnState::Completed));
    std::this_thread::sleep_for(100ms);

    assert(s.recognizer->calls == 2);
    auto errors = s.recorder.events(EventType::Error);
    assert(errors.size() == 1);
    assert(errors[0].error.code == ErrorCode::RecognitionTimeout);

    auto finals = s.recorder.events(EventType::FinalTranscript);
    assert(finals.size() == 1);
    assert(finals[0].transcript->failed());

    // Nothing to answer: the turn is closed degraded and nothing is generated
    assert(s.generator->calls == 0);
    assert(s.orchestrator->state() == ConversationState::Idle);
    assert(s.orchestrator->context().snapshot()->front().degraded);

    std::cout << "[PASS] Degraded turn after two timeouts\n";
}

void testBargeInFromAudio() {
    std::cout << "\n--- Test: Barge-in From Audio ---\n";

    Session s;
    s.generator->chunks = {"One. ", "Two. ", "Three. ", "Four. "};
    s.generator->hang_after_chunks = true;
    s.synthesizer->delay = 150ms;
    assert(s.start());

    s.push(1000, true);
    s.push(800, false);
    assert(s.recorder.waitFor([](const std::vector<EventRecorder::Entry>& log) {
        for (const auto& e : log) {
            if (e.is_chunk) return true;
        }
        return false;
    }));

    s.push(300, true);
    assert(s.recorder.waitForTurnState(Speaker::Assistant, TurnState::Cancelled));
    std::this_thread::sleep_for(400ms);

    auto log = s.recorder.log();
    size_t cancelled = log.size();
    for (size_t i = 0; i < log.size(); ++i) {
        const auto& e = log[i];
        if (!e.is_chunk && e.event.type == EventType::TurnStateChanged &&
            e.event.speaker == Speaker::Assistant && e.event.turn_state == TurnState::Cancelled) {
            cancelled = i;
            break;
        }
    }
    for (size_t i = cancelled; i < log.size(); ++i) {
        assert(!log[i].is_chunk);
    }
    assert(s.recorder.count(EventType::SpeechStarted) == 2);
    assert(s.orchestrator->state() == ConversationState::UserSpeaking);

    std::cout << "[PASS] Assistant audio stops at barge-in\n";
}

void testClose() {
    std::cout << "\n--- Test: Close ---\n";

    Session s;
    s.generator->hang_before_first = true;
    assert(s.start());

    // Close mid-utterance, then with an assistant turn in flight
    s.push(500, true);
    s.orchestrator->close();

    assert(s.recorder.count(EventType::SessionClosed) == 1);
    assert(s.recorder.count(EventType::UtteranceClosed) == 1);
    assert(!s.orchestrator->isOpen());

    auto pcm = pcmBytes(16000, 20, true);
    auto err = s.orchestrator->pushAudio(pcm.data(), pcm.size());
    assert(err.code == ErrorCode::SessionClosed);

    s.orchestrator->close();
    assert(s.recorder.count(EventType::SessionClosed) == 1);

    Session thinking;
    thinking.generator->hang_before_first = true;
    assert(thinking.start());
    thinking.push(1000, true);
    thinking.push(800, false);
    assert(thinking.recorder.waitForTurnState(Speaker::Assistant, TurnState::AssistantThinking));
    thinking.orchestrator->close();
    assert(thinking.recorder.count(EventType::SessionClosed) == 1);
    assert(thinking.recorder.waitForTurnState(Speaker::Assistant, TurnState::Cancelled, 100ms));
    assert(thinking.generator->cancellations_seen == 1);

    std::cout << "[PASS] Close flushes, cancels and is idempotent\n";
}

void testMissingCollaborator() {
    std::cout << "\n--- Test: Missing Collaborator ---\n";

    EventRecorder recorder;
    Collaborators c;
    c.recognizer = std::make_shared<FakeRecognizer>();
    Orchestrator orchestrator("incomplete", PipelineConfig{}, std::move(c), recorder.sinks());

    assert(!orchestrator.start());
    assert(orchestrator.lastError().find("missing collaborator") == 0);
    auto pcm = pcmBytes(16000, 20, true);
    assert(orchestrator.pushAudio(pcm.data(), pcm.size()).code == ErrorCode::SessionClosed);

    std::cout << "[PASS] Start refused without engines\n";
}

int main() {
    std::cout << "=== Orchestrator Tests ===\n";

    testSpeechToSpeech();
    testMalformedPayload();
    testRecognitionTimesOutTwice();
    testBargeInFromAudio();
    testClose();
    testMissingCollaborator();

    std::cout << "\n=== All Orchestrator tests completed ===\n";
    return 0;
}
