/**
 * FrameBuffer.cpp - Carry-over re-chunking of PCM16 payloads
 *
 * Multi-channel input is down-mixed to mono before framing.
 */

#include "parley/audio/FrameBuffer.hpp"

#include <algorithm>

namespace parley::audio {

FrameBuffer::FrameBuffer(std::string session_id, const AudioFormatConfig& format)
    : session_id_(std::move(session_id))
    , format_(format)
    , samples_per_frame_(std::max(1, (format.sample_rate * format.frame_ms) / 1000))
    , origin_(Clock::now())
{
    carry_.reserve(samples_per_frame_ * 2);
}

PipelineError FrameBuffer::push(const uint8_t* data, size_t size, const FrameCallback& emit) {
    const size_t block = 2 * static_cast<size_t>(format_.channels);

    if (!data || size == 0) {
        return {ErrorCode::MalformedAudio, "empty payload"};
    }
    if (size % block != 0) {
        return {ErrorCode::MalformedAudio,
                "payload of " + std::to_string(size) + " bytes is not a multiple of " +
                std::to_string(block)};
    }
    if (size > format_.max_payload_bytes) {
        return {ErrorCode::MalformedAudio,
                "payload of " + std::to_string(size) + " bytes exceeds limit"};
    }

    const size_t blocks = size / block;
    for (size_t i = 0; i < blocks; ++i) {
        int32_t mixed = 0;
        for (int c = 0; c < format_.channels; ++c) {
            const uint8_t* p = data + i * block + c * 2;
            mixed += static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                          (static_cast<uint16_t>(p[1]) << 8));
        }
        carry_.push_back(static_cast<int16_t>(mixed / format_.channels));

        if (carry_.size() == static_cast<size_t>(samples_per_frame_)) {
            std::vector<int16_t> samples;
            samples.swap(carry_);
            carry_.reserve(samples_per_frame_);
            emit(makeFrame(std::move(samples)));
        }
    }

    return {};
}

void FrameBuffer::flush(const FrameCallback& emit) {
    if (carry_.empty()) {
        return;
    }
    std::vector<int16_t> samples;
    samples.swap(carry_);
    samples.resize(samples_per_frame_, 0);
    emit(makeFrame(std::move(samples)));
}

void FrameBuffer::reset() {
    carry_.clear();
}

AudioFrame FrameBuffer::makeFrame(std::vector<int16_t>&& samples) {
    AudioFrame frame;
    frame.session_id = session_id_;
    frame.sequence_number = next_seq_;
    frame.capture_timestamp = origin_ + std::chrono::milliseconds(next_seq_ * format_.frame_ms);
    frame.duration_ms = format_.frame_ms;
    frame.samples = std::move(samples);
    ++next_seq_;
    return frame;
}

} // namespace parley::audio
