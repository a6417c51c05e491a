/**
 * TTSClient.hpp - Synthesizer backed by an HTTP TTS server
 *
 * POST /synthesize {"text", "voice", "speed", "language"} -> audio/wav
 */

#pragma once

#include "parley/tts/Synthesizer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace parley::tts {

struct WavAudio {
    std::vector<uint8_t> pcm16;  // little-endian mono
    int sample_rate = 0;
};

/**
 * Decode a RIFF/WAVE body (PCM16 or float32, any channel count) to mono PCM16.
 * Returns false and fills `error` on malformed input.
 */
bool decodeWav(const std::string& body, WavAudio& out, std::string& error);

class TTSClient : public Synthesizer {
public:
    explicit TTSClient(const std::string& server_url, int timeout_ms = 30000);
    ~TTSClient() override;

    bool isHealthy();

    SynthesisResult synthesize(const std::string& text,
                               const VoiceParams& voice,
                               const core::CancellationToken& cancel) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::tts
