/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * Local transport for the parley binary: microphone PCM16 in, synthesized
 * PCM16 out through a lock-free playback buffer.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley::audio {

struct AudioConfig {
    int sample_rate = 16000;        // capture rate
    int playback_rate = 24000;      // output stream rate
    int channels = 1;
    int frames_per_buffer = 320;    // 20 ms at 16 kHz
    int input_device = -1;          // -1 = default
    int output_device = -1;
    size_t playback_buffer_seconds = 30;
};

/**
 * Called from the PortAudio thread with interleaved PCM16 samples.
 * Must not block.
 */
using AudioCallback = std::function<void(const int16_t* samples, size_t count)>;

class AudioEngine {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    void setInputCallback(AudioCallback callback);

    /**
     * Queue mono PCM16 at `sample_rate` for playback, resampling to the
     * output rate. Returns the number of output samples queued.
     */
    size_t queuePlayback(const int16_t* samples, size_t count, int sample_rate);

    /**
     * Drop queued playback (barge-in). Takes effect on the next callback.
     */
    void clearPlayback();
    bool isPlaying() const;

    static std::vector<int16_t> convertRate(const int16_t* samples, size_t count, int from_rate, int to_rate);

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace parley::audio
