/**
 * test_segmenter.cpp - Speech segmentation on synthetic audio
 */

#include "parley/audio/FrameBuffer.hpp"
#include "parley/audio/SpeechDetector.hpp"
#include "parley/audio/VoiceActivitySegmenter.hpp"
#include "parley/core/BoundedQueue.hpp"

#include "../support/FakeCollaborators.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace parley;
using namespace parley::audio;
using parley::testing::pcmBytes;

namespace {

struct Harness {
    AudioFormatConfig format;
    VadConfig vad;
    core::BoundedQueue<Utterance> queue;
    FrameBuffer frames;
    VoiceActivitySegmenter segmenter;

    std::vector<std::pair<uint64_t, uint64_t>> starts;  // (utterance id, start seq)
    std::vector<uint64_t> closed;
    std::vector<uint64_t> dropped;

    Harness(const VadConfig& v, size_t capacity)
        : vad(v)
        , queue(capacity)
        , frames("seg", format)
        , segmenter("seg", v, std::make_unique<EnergyDetector>(), queue, callbacks())
    {
    }

    VoiceActivitySegmenter::Callbacks callbacks() {
        VoiceActivitySegmenter::Callbacks cb;
        cb.onSpeechStart = [this](uint64_t id, uint64_t seq) { starts.emplace_back(id, seq); };
        cb.onUtteranceClosed = [this](const Utterance& u) { closed.push_back(u.utterance_id); };
        cb.onBackpressureDrop = [this](const Utterance& u) { dropped.push_back(u.utterance_id); };
        return cb;
    }

    void feed(int ms, bool voiced) {
        auto bytes = pcmBytes(format.sample_rate, ms, voiced);
        auto err = frames.push(bytes.data(), bytes.size(), [this](AudioFrame&& f) {
            segmenter.process(std::move(f));
        });
        assert(!err);
    }
};

VadConfig defaultVad() {
    VadConfig vad;
    vad.threshold = 0.02f;
    vad.start_frames = 3;
    vad.end_frames = 25;   // 500 ms at 20 ms frames
    vad.max_utterance_ms = 15000;
    return vad;
}

} // anonymous namespace

void test_single_utterance() {
    Harness h(defaultVad(), 8);

    h.feed(2000, true);
    assert(h.segmenter.inUtterance());
    assert(h.segmenter.state() == SegmenterState::Speech);
    h.feed(1000, false);

    assert(h.starts.size() == 1);
    assert(h.starts[0].first == 1);
    assert(h.starts[0].second == 0);  // debounce frames belong to the utterance
    assert(h.closed.size() == 1);
    assert(!h.segmenter.inUtterance());
    assert(h.segmenter.state() == SegmenterState::Silence);

    auto utterance = h.queue.tryPop();
    assert(utterance);
    assert(utterance->utterance_id == 1);
    assert(utterance->close_reason == CloseReason::SpeechEnd);
    assert(utterance->start_frame_seq == 0);
    assert(utterance->end_frame_seq == 99);   // trailing silence trimmed
    assert(utterance->durationMs() == 2000);
    assert(utterance->frames.size() == 100);
    assert(!h.queue.tryPop());

    std::cout << "[PASS] test_single_utterance" << std::endl;
}

void test_short_blip_ignored() {
    Harness h(defaultVad(), 8);

    h.feed(40, true);   // 2 frames, below the start debounce
    h.feed(500, false);
    assert(h.starts.empty());
    assert(h.queue.empty());

    std::cout << "[PASS] test_short_blip_ignored" << std::endl;
}

void test_pause_inside_utterance() {
    Harness h(defaultVad(), 8);

    // 300 ms pause is below the 500 ms end debounce
    h.feed(600, true);
    h.feed(300, false);
    h.feed(600, true);
    h.feed(1000, false);

    assert(h.closed.size() == 1);
    auto utterance = h.queue.tryPop();
    assert(utterance);
    assert(utterance->durationMs() == 1500);  // pause kept, trailing silence trimmed

    std::cout << "[PASS] test_pause_inside_utterance" << std::endl;
}

void test_max_duration_split() {
    VadConfig vad = defaultVad();
    vad.max_utterance_ms = 1000;
    Harness h(vad, 8);

    h.feed(2000, true);
    h.feed(1000, false);

    assert(h.closed.size() == 2);
    auto first = h.queue.tryPop();
    auto second = h.queue.tryPop();
    assert(first && second);
    assert(first->close_reason == CloseReason::MaxDuration);
    assert(first->durationMs() <= 1000);
    assert(second->start_frame_seq > first->end_frame_seq);
    assert(second->durationMs() <= 1000);

    std::cout << "[PASS] test_max_duration_split" << std::endl;
}

void test_backpressure_drops_oldest() {
    Harness h(defaultVad(), 1);

    for (int i = 0; i < 3; ++i) {
        h.feed(200, true);
        h.feed(600, false);
    }

    assert(h.closed.size() == 3);
    assert(h.dropped.size() == 2);
    assert(h.dropped[0] == 1);
    assert(h.dropped[1] == 2);
    assert(h.segmenter.utterancesDropped() == 2);

    auto kept = h.queue.tryPop();
    assert(kept && kept->utterance_id == 3);

    std::cout << "[PASS] test_backpressure_drops_oldest" << std::endl;
}

void test_flush_closes_open_utterance() {
    Harness h(defaultVad(), 8);

    h.feed(400, true);
    assert(h.segmenter.inUtterance());
    h.segmenter.flush();

    assert(!h.segmenter.inUtterance());
    auto utterance = h.queue.tryPop();
    assert(utterance);
    assert(utterance->close_reason == CloseReason::Flush);

    std::cout << "[PASS] test_flush_closes_open_utterance" << std::endl;
}

void test_out_of_order_frame_ignored() {
    VadConfig vad = defaultVad();
    core::BoundedQueue<Utterance> queue(4);
    VoiceActivitySegmenter segmenter("seg", vad, std::make_unique<EnergyDetector>(), queue, {});

    auto frame = [](uint64_t seq) {
        AudioFrame f;
        f.sequence_number = seq;
        f.duration_ms = 20;
        f.samples.assign(320, 8000);
        return f;
    };

    segmenter.process(frame(5));
    segmenter.process(frame(4));  // stale
    segmenter.process(frame(5));  // duplicate
    assert(segmenter.framesProcessed() == 1);

    std::cout << "[PASS] test_out_of_order_frame_ignored" << std::endl;
}

int main() {
    std::cout << "=== VoiceActivitySegmenter Tests ===" << std::endl;

    test_single_utterance();
    test_short_blip_ignored();
    test_pause_inside_utterance();
    test_max_duration_split();
    test_backpressure_drops_oldest();
    test_flush_closes_open_utterance();
    test_out_of_order_frame_ignored();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
