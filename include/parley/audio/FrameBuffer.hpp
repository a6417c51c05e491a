/**
 * FrameBuffer.hpp - Re-chunks raw transport bytes into fixed-duration frames
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace parley::audio {

class FrameBuffer {
public:
    using FrameCallback = std::function<void(AudioFrame&&)>;

    FrameBuffer(std::string session_id, const AudioFormatConfig& format);

    /**
     * Append a PCM16 little-endian payload and emit every complete frame.
     * A malformed payload is dropped whole; returns MalformedAudio in that
     * case and leaves the carry-over untouched.
     */
    PipelineError push(const uint8_t* data, size_t size, const FrameCallback& emit);

    /**
     * Emit the carry-over as a final zero-padded frame, if any.
     */
    void flush(const FrameCallback& emit);

    void reset();

    int samplesPerFrame() const { return samples_per_frame_; }
    size_t pendingSamples() const { return carry_.size(); }
    uint64_t nextSequence() const { return next_seq_; }

private:
    AudioFrame makeFrame(std::vector<int16_t>&& samples);

    std::string session_id_;
    AudioFormatConfig format_;
    int samples_per_frame_;
    std::vector<int16_t> carry_;
    uint64_t next_seq_ = 0;
    TimePoint origin_;
};

} // namespace parley::audio
