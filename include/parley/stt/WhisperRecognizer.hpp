/**
 * WhisperRecognizer.hpp - Recognizer using whisper.cpp
 *
 * Local, offline speech recognition. The model is loaded once and stays
 * resident; calls are serialized on the single whisper context.
 */

#pragma once

#include "parley/stt/Recognizer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parley::stt {

class WhisperRecognizer : public Recognizer {
public:
    WhisperRecognizer(const std::string& model_path, int n_threads = 4);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    bool isReady() const;
    std::string getModelInfo() const;

    /**
     * Sample rate the model expects; utterances are resampled to it.
     */
    static int getSampleRate();

    RecognitionResult recognize(const Utterance& utterance,
                                const std::string& language_hint,
                                const PartialCallback& on_partial,
                                const core::CancellationToken& cancel) override;

    /**
     * Linear resampling of mono float audio.
     */
    static std::vector<float> resample(const std::vector<float>& input, int from_rate, int to_rate);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::stt
