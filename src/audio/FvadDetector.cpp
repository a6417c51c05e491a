/**
 * FvadDetector.cpp - Voice Activity Detection via libfvad
 *
 * Requires libfvad to be installed. Frames must be 10, 20 or 30 ms at
 * 8, 16, 32 or 48 kHz.
 */

#include "parley/audio/SpeechDetector.hpp"

#include <fvad.h>
#include <iostream>

namespace parley::audio {

struct FvadDetector::Impl {
    Fvad* vad = nullptr;
    int sample_rate;
    int mode;
};

FvadDetector::FvadDetector(int sample_rate, int mode)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->mode = mode;

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[FvadDetector] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[FvadDetector] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, mode) < 0) {
        std::cerr << "[FvadDetector] Invalid mode " << mode << ", keeping default" << std::endl;
    }

    std::cout << "[FvadDetector] Initialized (sample_rate=" << sample_rate
              << "Hz, mode=" << mode << ")" << std::endl;
}

FvadDetector::~FvadDetector() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool FvadDetector::isReady() const {
    return pImpl_->vad != nullptr;
}

float FvadDetector::score(const AudioFrame& frame) {
    if (!pImpl_->vad || frame.samples.empty()) {
        return 0.0f;
    }

    int result = fvad_process(pImpl_->vad, frame.samples.data(), frame.samples.size());
    if (result < 0) {
        std::cerr << "[FvadDetector] Frame " << frame.sequence_number
                  << " rejected (length " << frame.samples.size() << ")" << std::endl;
        return 0.0f;
    }
    return result == 1 ? 1.0f : 0.0f;
}

void FvadDetector::reset() {
    if (pImpl_->vad) {
        // fvad_reset restores library defaults
        fvad_reset(pImpl_->vad);
        if (fvad_set_sample_rate(pImpl_->vad, pImpl_->sample_rate) < 0) {
            std::cerr << "[FvadDetector] Reset failed to restore sample rate" << std::endl;
        }
        if (fvad_set_mode(pImpl_->vad, pImpl_->mode) < 0) {
            std::cerr << "[FvadDetector] Reset failed to restore mode " << pImpl_->mode << std::endl;
        }
    }
}

} // namespace parley::audio
