/**
 * VoiceActivitySegmenter.cpp - Debounced speech start/end detection
 *
 * The N debounce frames belong to the utterance, so start_frame_seq is the
 * first voiced frame of the run. Trailing unvoiced hangover frames are
 * trimmed, so end_frame_seq is the last voiced frame.
 */

#include "parley/audio/VoiceActivitySegmenter.hpp"

#include <iostream>

namespace parley::audio {

const char* toString(SegmenterState state) {
    switch (state) {
        case SegmenterState::Silence: return "SILENCE";
        case SegmenterState::SpeechStart: return "SPEECH_START";
        case SegmenterState::Speech: return "SPEECH";
        case SegmenterState::SpeechEnd: return "SPEECH_END";
    }
    return "UNKNOWN";
}

VoiceActivitySegmenter::VoiceActivitySegmenter(std::string session_id,
                                               const VadConfig& config,
                                               std::unique_ptr<SpeechDetector> detector,
                                               core::BoundedQueue<Utterance>& output,
                                               Callbacks callbacks)
    : session_id_(std::move(session_id))
    , config_(config)
    , detector_(std::move(detector))
    , output_(output)
    , callbacks_(std::move(callbacks))
{
    std::cout << "[VoiceActivitySegmenter] " << session_id_ << ": detector=" << detector_->name()
              << " threshold=" << config_.threshold
              << " start=" << config_.start_frames << " end=" << config_.end_frames
              << " max=" << config_.max_utterance_ms << "ms" << std::endl;
}

void VoiceActivitySegmenter::process(AudioFrame&& frame) {
    if (last_seq_) {
        if (frame.sequence_number <= *last_seq_) {
            std::cerr << "[VoiceActivitySegmenter] " << session_id_ << ": ignoring frame "
                      << frame.sequence_number << " (last was " << *last_seq_ << ")" << std::endl;
            return;
        }
        if (frame.sequence_number != *last_seq_ + 1) {
            std::cerr << "[VoiceActivitySegmenter] " << session_id_ << ": gap of "
                      << (frame.sequence_number - *last_seq_ - 1) << " frames before "
                      << frame.sequence_number << std::endl;
        }
    }
    last_seq_ = frame.sequence_number;
    ++frames_;

    const bool voiced = detector_->score(frame) >= config_.threshold;

    if (!current_) {
        if (!voiced) {
            pending_.clear();
            return;
        }

        pending_.push_back(std::move(frame));
        if (static_cast<int>(pending_.size()) >= config_.start_frames) {
            setState(SegmenterState::SpeechStart);
            openUtterance();
            setState(SegmenterState::Speech);
            if (current_ms_ >= config_.max_utterance_ms) {
                closeUtterance(CloseReason::MaxDuration);
            }
        }
        return;
    }

    current_ms_ += frame.duration_ms;

    if (voiced) {
        for (auto& held : hangover_) {
            current_->frames.push_back(std::move(held));
        }
        hangover_.clear();
        current_->end_frame_seq = frame.sequence_number;
        current_->frames.push_back(std::move(frame));
    } else {
        hangover_.push_back(std::move(frame));
        if (static_cast<int>(hangover_.size()) >= config_.end_frames) {
            setState(SegmenterState::SpeechEnd);
            closeUtterance(CloseReason::SpeechEnd);
            return;
        }
    }

    if (current_ms_ >= config_.max_utterance_ms) {
        std::cerr << "[VoiceActivitySegmenter] " << session_id_ << ": utterance "
                  << current_->utterance_id << " reached max duration" << std::endl;
        closeUtterance(CloseReason::MaxDuration);
    }
}

void VoiceActivitySegmenter::flush() {
    pending_.clear();
    if (current_) {
        closeUtterance(CloseReason::Flush);
    }
}

void VoiceActivitySegmenter::openUtterance() {
    Utterance utterance;
    utterance.session_id = session_id_;
    utterance.utterance_id = next_utterance_id_++;
    utterance.start_frame_seq = pending_.front().sequence_number;
    utterance.end_frame_seq = pending_.back().sequence_number;

    current_ms_ = 0;
    for (auto& frame : pending_) {
        current_ms_ += frame.duration_ms;
        utterance.frames.push_back(std::move(frame));
    }
    pending_.clear();
    hangover_.clear();

    current_ = std::move(utterance);
    ++opened_;

    if (callbacks_.onSpeechStart) {
        callbacks_.onSpeechStart(current_->utterance_id, current_->start_frame_seq);
    }
}

void VoiceActivitySegmenter::closeUtterance(CloseReason reason) {
    Utterance utterance = std::move(*current_);
    current_.reset();
    hangover_.clear();
    current_ms_ = 0;
    utterance.close_reason = reason;
    ++closed_;
    setState(SegmenterState::Silence);

    std::cout << "[VoiceActivitySegmenter] " << session_id_ << ": utterance "
              << utterance.utterance_id << " frames " << utterance.start_frame_seq << ".."
              << utterance.end_frame_seq << " (" << utterance.durationMs() << "ms, "
              << toString(reason) << ")" << std::endl;

    if (callbacks_.onUtteranceClosed) {
        callbacks_.onUtteranceClosed(utterance);
    }

    auto dropped = output_.pushDropOldest(std::move(utterance));
    if (dropped) {
        ++dropped_;
        std::cerr << "[VoiceActivitySegmenter] " << session_id_ << ": queue full, dropped utterance "
                  << dropped->utterance_id << std::endl;
        if (callbacks_.onBackpressureDrop) {
            callbacks_.onBackpressureDrop(*dropped);
        }
    }
}

void VoiceActivitySegmenter::setState(SegmenterState state) {
    state_ = state;
}

} // namespace parley::audio
