/**
 * TTSClient.cpp - HTTP synthesis client
 *
 * Connects to a persistent TTS server that keeps the model and speaker
 * embedding cached, and converts its WAV replies to PCM16.
 */

#include "parley/tts/TTSClient.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::tts {

namespace {

uint16_t readU16(const std::string& data, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

uint32_t readU32(const std::string& data, size_t offset) {
    return static_cast<uint32_t>(readU16(data, offset)) |
           (static_cast<uint32_t>(readU16(data, offset + 2)) << 16);
}

void appendSample(std::vector<uint8_t>& out, float value) {
    value = std::max(-1.0f, std::min(1.0f, value));
    auto sample = static_cast<int16_t>(value * 32767.0f);
    out.push_back(static_cast<uint8_t>(sample & 0xff));
    out.push_back(static_cast<uint8_t>((sample >> 8) & 0xff));
}

} // anonymous namespace

bool decodeWav(const std::string& body, WavAudio& out, std::string& error) {
    if (body.size() < 44 || body.compare(0, 4, "RIFF") != 0 || body.compare(8, 4, "WAVE") != 0) {
        error = "no RIFF/WAVE header";
        return false;
    }

    uint16_t audio_format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; the header may be longer than 44 bytes
    size_t pos = 12;
    while (pos + 8 <= body.size()) {
        std::string id = body.substr(pos, 4);
        uint32_t size = readU32(body, pos + 4);
        size_t payload = pos + 8;
        if (id == "fmt " && payload + 16 <= body.size()) {
            audio_format = readU16(body, payload);
            channels = readU16(body, payload + 2);
            sample_rate = readU32(body, payload + 4);
            bits_per_sample = readU16(body, payload + 14);
        } else if (id == "data") {
            data_offset = payload;
            data_size = std::min<size_t>(size, body.size() - payload);
            break;
        }
        pos = payload + size + (size & 1);
    }

    if (data_offset == 0) {
        error = "no data chunk";
        return false;
    }
    if (channels == 0 || sample_rate == 0) {
        error = "no fmt chunk";
        return false;
    }

    out.sample_rate = static_cast<int>(sample_rate);
    out.pcm16.clear();

    if (bits_per_sample == 16 && audio_format == 1) {
        size_t frames = data_size / (2 * channels);
        out.pcm16.reserve(frames * 2);
        for (size_t f = 0; f < frames; ++f) {
            int32_t sum = 0;
            for (uint16_t c = 0; c < channels; ++c) {
                sum += static_cast<int16_t>(readU16(body, data_offset + (f * channels + c) * 2));
            }
            auto mixed = static_cast<int16_t>(sum / channels);
            out.pcm16.push_back(static_cast<uint8_t>(mixed & 0xff));
            out.pcm16.push_back(static_cast<uint8_t>((mixed >> 8) & 0xff));
        }
    } else if (bits_per_sample == 32 && audio_format == 3) {
        // 32-bit float (IEEE)
        size_t frames = data_size / (4 * channels);
        out.pcm16.reserve(frames * 2);
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                uint32_t bits = readU32(body, data_offset + (f * channels + c) * 4);
                float value;
                std::memcpy(&value, &bits, sizeof(value));
                sum += value;
            }
            appendSample(out.pcm16, sum / channels);
        }
    } else {
        error = "unsupported WAV format: " + std::to_string(bits_per_sample) + " bits, format " +
                std::to_string(audio_format);
        return false;
    }

    return true;
}

struct TTSClient::Impl {
    std::string server_url;
    int timeout_ms;

    Impl(const std::string& url, int timeout) : server_url(url), timeout_ms(timeout) {}

    std::unique_ptr<httplib::Client> makeClient() const {
        auto client = std::make_unique<httplib::Client>(server_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        return client;
    }
};

TTSClient::TTSClient(const std::string& server_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(server_url, timeout_ms)) {
    std::cout << "[TTSClient] Using TTS server at " << server_url << std::endl;
}

TTSClient::~TTSClient() = default;

bool TTSClient::isHealthy() {
    auto client = impl_->makeClient();
    auto res = client->Get("/health");
    return res && res->status == 200;
}

SynthesisResult TTSClient::synthesize(const std::string& text,
                                      const VoiceParams& voice,
                                      const core::CancellationToken& cancel) {
    SynthesisResult result;
    if (text.empty()) {
        result.error = ErrorCode::SynthesisError;
        result.error_message = "empty text";
        return result;
    }

    json request = {
        {"text", text},
        {"voice", voice.voice},
        {"speed", voice.speed},
        {"language", voice.language}
    };

    auto client = impl_->makeClient();
    std::string body;
    int status = 0;

    httplib::Request req;
    req.method = "POST";
    req.path = "/synthesize";
    req.set_header("Content-Type", "application/json");
    req.body = request.dump();
    req.response_handler = [&](const httplib::Response& res) {
        status = res.status;
        return res.status == 200;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (cancel.isCancelled()) return false;
        body.append(data, length);
        return true;
    };

    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished) {
            if (cancel.waitFor(std::chrono::milliseconds(20))) {
                client->stop();
                return;
            }
        }
    });

    auto res = client->send(req);

    finished = true;
    watcher.join();

    if (cancel.isCancelled()) {
        result.error = ErrorCode::CancellationRace;
        result.error_message = "cancelled";
        return result;
    }
    if (status != 0 && status != 200) {
        result.error = ErrorCode::SynthesisError;
        result.error_message = "HTTP " + std::to_string(status);
        return result;
    }
    if (!res) {
        result.error = ErrorCode::SynthesisError;
        result.error_message = httplib::to_string(res.error());
        return result;
    }

    WavAudio audio;
    std::string error;
    if (!decodeWav(body, audio, error)) {
        std::cerr << "[TTSClient] Invalid WAV: " << error << std::endl;
        result.error = ErrorCode::SynthesisError;
        result.error_message = error;
        return result;
    }

    result.audio = std::move(audio.pcm16);
    result.sample_rate = audio.sample_rate;
    return result;
}

} // namespace parley::tts
