/**
 * SpeechDetector.hpp - Pluggable per-frame speech scoring
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"

#include <memory>

namespace parley::audio {

/**
 * Scores a frame in [0, 1]. The segmenter compares the score against its
 * configured threshold; the detector itself keeps no speech/silence state
 * beyond smoothing.
 */
class SpeechDetector {
public:
    virtual ~SpeechDetector() = default;

    virtual float score(const AudioFrame& frame) = 0;
    virtual void reset() {}
    virtual const char* name() const = 0;
};

/**
 * RMS energy, optionally smoothed with an exponential moving average.
 */
class EnergyDetector : public SpeechDetector {
public:
    explicit EnergyDetector(float smoothing = 0.0f);

    float score(const AudioFrame& frame) override;
    void reset() override;
    const char* name() const override { return "energy"; }

    static float rms(const int16_t* samples, size_t count);

private:
    float smoothing_;
    float previous_ = 0.0f;
    bool primed_ = false;
};

/**
 * WebRTC VAD via libfvad. Scores are 0 or 1.
 */
class FvadDetector : public SpeechDetector {
public:
    FvadDetector(int sample_rate, int mode);
    ~FvadDetector() override;

    FvadDetector(const FvadDetector&) = delete;
    FvadDetector& operator=(const FvadDetector&) = delete;

    float score(const AudioFrame& frame) override;
    void reset() override;
    const char* name() const override { return "fvad"; }

    bool isReady() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

std::unique_ptr<SpeechDetector> makeDetector(const PipelineConfig& config);

} // namespace parley::audio
