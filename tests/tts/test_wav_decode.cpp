/**
 * test_wav_decode.cpp - Unit tests for the TTS server's WAV decoding
 */

#include "parley/tts/TTSClient.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace parley::tts;

namespace {

void putU16(std::string& s, uint16_t v) {
    s.push_back(static_cast<char>(v & 0xff));
    s.push_back(static_cast<char>((v >> 8) & 0xff));
}

void putU32(std::string& s, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        s.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

std::string fmtChunk(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits) {
    std::string s = "fmt ";
    putU32(s, 16);
    putU16(s, format);
    putU16(s, channels);
    putU32(s, rate);
    putU32(s, rate * channels * bits / 8);
    putU16(s, static_cast<uint16_t>(channels * bits / 8));
    putU16(s, bits);
    return s;
}

std::string wav(const std::vector<std::string>& chunks) {
    std::string body;
    for (const auto& c : chunks) {
        body += c;
    }
    std::string s = "RIFF";
    putU32(s, static_cast<uint32_t>(4 + body.size()));
    s += "WAVE";
    return s + body;
}

std::string dataChunk(const std::string& payload) {
    std::string s = "data";
    putU32(s, static_cast<uint32_t>(payload.size()));
    return s + payload;
}

int16_t sampleAt(const WavAudio& audio, size_t i) {
    return static_cast<int16_t>(audio.pcm16[2 * i] | (audio.pcm16[2 * i + 1] << 8));
}

} // anonymous namespace

void test_pcm16_mono() {
    std::string payload;
    for (int16_t v : {100, -200, 300, -400}) {
        putU16(payload, static_cast<uint16_t>(v));
    }
    WavAudio audio;
    std::string error;
    assert(decodeWav(wav({fmtChunk(1, 1, 22050, 16), dataChunk(payload)}), audio, error));
    assert(audio.sample_rate == 22050);
    assert(audio.pcm16.size() == 8);
    assert(sampleAt(audio, 0) == 100);
    assert(sampleAt(audio, 3) == -400);

    std::cout << "[PASS] test_pcm16_mono" << std::endl;
}

void test_stereo_downmix() {
    std::string payload;
    // Two frames: (1000, 3000) and (-500, -1500)
    for (int16_t v : {1000, 3000, -500, -1500}) {
        putU16(payload, static_cast<uint16_t>(v));
    }
    WavAudio audio;
    std::string error;
    assert(decodeWav(wav({fmtChunk(1, 2, 24000, 16), dataChunk(payload)}), audio, error));
    assert(audio.sample_rate == 24000);
    assert(audio.pcm16.size() == 4);
    assert(sampleAt(audio, 0) == 2000);
    assert(sampleAt(audio, 1) == -1000);

    std::cout << "[PASS] test_stereo_downmix" << std::endl;
}

void test_float32_clamped() {
    std::string payload;
    for (float f : {0.5f, -1.0f, 2.0f}) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        putU32(payload, bits);
    }
    WavAudio audio;
    std::string error;
    assert(decodeWav(wav({fmtChunk(3, 1, 16000, 32), dataChunk(payload)}), audio, error));
    assert(audio.sample_rate == 16000);
    assert(audio.pcm16.size() == 6);
    assert(sampleAt(audio, 0) > 16000 && sampleAt(audio, 0) < 16500);
    assert(sampleAt(audio, 1) == -32767);
    assert(sampleAt(audio, 2) == 32767);

    std::cout << "[PASS] test_float32_clamped" << std::endl;
}

void test_extra_chunk_before_data() {
    std::string list = "LIST";
    putU32(list, 5);
    list += "INFOx";
    list.push_back('\0');  // pad byte for the odd-sized chunk

    std::string payload;
    putU16(payload, 1234);
    WavAudio audio;
    std::string error;
    assert(decodeWav(wav({fmtChunk(1, 1, 24000, 16), list, dataChunk(payload)}), audio, error));
    assert(audio.pcm16.size() == 2);
    assert(sampleAt(audio, 0) == 1234);

    std::cout << "[PASS] test_extra_chunk_before_data" << std::endl;
}

void test_malformed() {
    WavAudio audio;
    std::string error;

    assert(!decodeWav("RIFF", audio, error));
    assert(error == "no RIFF/WAVE header");

    std::string not_wave = wav({fmtChunk(1, 1, 24000, 16), dataChunk(std::string(8, '\0'))});
    not_wave.replace(8, 4, "AVI ");
    assert(!decodeWav(not_wave, audio, error));
    assert(error == "no RIFF/WAVE header");

    std::string junk = "junk";
    putU32(junk, 32);
    junk += std::string(32, '\0');
    assert(!decodeWav(wav({fmtChunk(1, 1, 24000, 16), junk}), audio, error));
    assert(error == "no data chunk");

    assert(!decodeWav(wav({junk, dataChunk(std::string(8, '\0'))}), audio, error));
    assert(error == "no fmt chunk");

    assert(!decodeWav(wav({fmtChunk(1, 1, 8000, 8), dataChunk(std::string(40, '\x80'))}), audio, error));
    assert(error.find("unsupported WAV format") == 0);

    std::cout << "[PASS] test_malformed" << std::endl;
}

int main() {
    std::cout << "=== WAV Decode Tests ===" << std::endl;

    test_pcm16_mono();
    test_stereo_downmix();
    test_float32_clamped();
    test_extra_chunk_before_data();
    test_malformed();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
