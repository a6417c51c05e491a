/**
 * VoiceActivitySegmenter.hpp - Hysteresis speech segmentation into utterances
 *
 * SILENCE -> SPEECH_START -> SPEECH -> SPEECH_END -> SILENCE
 *
 * Runs inline on the transport thread and never blocks: completed
 * utterances go to a bounded queue that sheds its oldest entry when full.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"
#include "parley/audio/SpeechDetector.hpp"
#include "parley/core/BoundedQueue.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley::audio {

enum class SegmenterState {
    Silence,
    SpeechStart,
    Speech,
    SpeechEnd
};

const char* toString(SegmenterState state);

class VoiceActivitySegmenter {
public:
    struct Callbacks {
        std::function<void(uint64_t utterance_id, uint64_t start_seq)> onSpeechStart;
        std::function<void(const Utterance&)> onUtteranceClosed;
        std::function<void(const Utterance& dropped)> onBackpressureDrop;
    };

    VoiceActivitySegmenter(std::string session_id,
                           const VadConfig& config,
                           std::unique_ptr<SpeechDetector> detector,
                           core::BoundedQueue<Utterance>& output,
                           Callbacks callbacks);

    void process(AudioFrame&& frame);

    /**
     * Close the open utterance, if any, with reason Flush.
     */
    void flush();

    SegmenterState state() const { return state_; }
    bool inUtterance() const { return current_.has_value(); }
    uint64_t utterancesOpened() const { return opened_; }
    uint64_t utterancesClosed() const { return closed_; }
    uint64_t utterancesDropped() const { return dropped_; }
    uint64_t framesProcessed() const { return frames_; }

private:
    void openUtterance();
    void closeUtterance(CloseReason reason);
    void setState(SegmenterState state);

    std::string session_id_;
    VadConfig config_;
    std::unique_ptr<SpeechDetector> detector_;
    core::BoundedQueue<Utterance>& output_;
    Callbacks callbacks_;

    SegmenterState state_ = SegmenterState::Silence;
    std::vector<AudioFrame> pending_;   // voiced run not yet confirmed
    std::vector<AudioFrame> hangover_;  // unvoiced run inside an utterance
    std::optional<Utterance> current_;
    int current_ms_ = 0;

    std::optional<uint64_t> last_seq_;
    uint64_t next_utterance_id_ = 1;
    uint64_t opened_ = 0;
    uint64_t closed_ = 0;
    uint64_t dropped_ = 0;
    uint64_t frames_ = 0;
};

} // namespace parley::audio
