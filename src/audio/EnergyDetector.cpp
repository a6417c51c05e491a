/**
 * EnergyDetector.cpp - RMS energy speech score
 */

#include "parley/audio/SpeechDetector.hpp"

#include <cmath>
#include <iostream>

namespace parley::audio {

EnergyDetector::EnergyDetector(float smoothing) : smoothing_(smoothing) {}

float EnergyDetector::rms(const int16_t* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }

    double sum_squares = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double x = samples[i] / 32768.0;
        sum_squares += x * x;
    }
    return static_cast<float>(std::sqrt(sum_squares / static_cast<double>(count)));
}

float EnergyDetector::score(const AudioFrame& frame) {
    float energy = rms(frame.samples.data(), frame.samples.size());

    if (smoothing_ <= 0.0f) {
        return energy;
    }
    if (!primed_) {
        previous_ = energy;
        primed_ = true;
        return energy;
    }

    previous_ = smoothing_ * previous_ + (1.0f - smoothing_) * energy;
    return previous_;
}

void EnergyDetector::reset() {
    previous_ = 0.0f;
    primed_ = false;
}

std::unique_ptr<SpeechDetector> makeDetector(const PipelineConfig& config) {
    if (config.vad.detector == DetectorKind::Fvad) {
        auto fvad = std::make_unique<FvadDetector>(config.audio.sample_rate, config.vad.fvad_mode);
        if (fvad->isReady()) {
            return fvad;
        }
        std::cerr << "[SpeechDetector] fvad unavailable, falling back to energy detector" << std::endl;
    }
    return std::make_unique<EnergyDetector>(config.vad.smoothing);
}

} // namespace parley::audio
