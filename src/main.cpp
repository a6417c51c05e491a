/**
 * parley - Main Entry Point
 *
 * Local voice conversation loop: microphone → whisper.cpp → llama.cpp
 * server → TTS server → speakers, with barge-in.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "parley/Config.hpp"
#include "parley/Events.hpp"
#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/RingBuffer.hpp"
#include "parley/llm/ConversationEngine.hpp"
#include "parley/session/SessionManager.hpp"
#include "parley/stt/WhisperRecognizer.hpp"
#include "parley/tts/TTSClient.hpp"

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

struct Options {
    std::string config_path;
    std::string whisper_model = "models/whisper/ggml-small-q5_1.bin";
    std::string llm_url = "http://127.0.0.1:8080";
    std::string tts_url = "http://127.0.0.1:5002";
    bool list_devices = false;
    bool verbose = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <file>    JSON pipeline configuration\n"
              << "  --whisper <model>  whisper.cpp ggml model path\n"
              << "  --llm <url>        llama.cpp server URL\n"
              << "  --tts <url>        TTS server URL\n"
              << "  --list-devices     list audio devices and exit\n"
              << "  --verbose          debug logging\n";
}

bool parseArgs(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[parley] Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!value(options.config_path)) return false;
        } else if (arg == "--whisper") {
            if (!value(options.whisper_model)) return false;
        } else if (arg == "--llm") {
            if (!value(options.llm_url)) return false;
        } else if (arg == "--tts") {
            if (!value(options.tts_url)) return false;
        } else if (arg == "--list-devices") {
            options.list_devices = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "[parley] Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void logEvent(const parley::PipelineEvent& event, bool verbose) {
    using parley::EventType;
    switch (event.type) {
        case EventType::PartialTranscript:
            if (verbose && event.transcript) {
                std::cout << "[parley] ... " << event.transcript->text << std::endl;
            }
            break;
        case EventType::FinalTranscript:
            if (event.transcript) {
                std::cout << "[parley] " << event.transcript->speaker_label.value_or("user")
                          << ": " << event.transcript->text << std::endl;
            }
            break;
        case EventType::TurnStateChanged:
            std::cout << "[parley] turn " << event.turn_id << " (" << parley::toString(event.speaker)
                      << ") " << parley::toString(event.turn_state) << "  ["
                      << parley::toString(event.from) << " -> " << parley::toString(event.to) << "]"
                      << std::endl;
            break;
        case EventType::Error:
        case EventType::UnableToRespond:
            std::cerr << "[parley] " << parley::toString(event.type) << ": "
                      << parley::toString(event.error.code) << " " << event.error.message << std::endl;
            break;
        case EventType::SpeechStarted:
        case EventType::UtteranceClosed:
            if (verbose) {
                std::cout << "[parley] " << parley::toString(event.type) << " #" << event.utterance_id
                          << std::endl;
            }
            break;
        case EventType::SessionClosed:
            std::cout << "[parley] session " << event.session_id << " closed" << std::endl;
            break;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    if (options.list_devices) {
        std::cout << "Input devices:" << std::endl;
        int index = 0;
        for (const auto& name : parley::audio::AudioEngine::listInputDevices()) {
            std::cout << "  [" << index++ << "] " << name << std::endl;
        }
        std::cout << "Output devices:" << std::endl;
        index = 0;
        for (const auto& name : parley::audio::AudioEngine::listOutputDevices()) {
            std::cout << "  [" << index++ << "] " << name << std::endl;
        }
        return 0;
    }

    parley::PipelineConfig config;
    if (!options.config_path.empty()) {
        std::string error;
        auto loaded = parley::loadConfigFile(options.config_path, &error);
        if (!loaded) {
            std::cerr << "[parley] " << error << std::endl;
            return 1;
        }
        config = *loaded;
    }
    if (options.verbose) {
        config.log.verbose = true;
    }

    auto problems = parley::validateConfig(config);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[parley] invalid config: " << problem << std::endl;
        }
        return 1;
    }

    std::cout << "[parley] Loading whisper model..." << std::endl;
    auto recognizer = std::make_shared<parley::stt::WhisperRecognizer>(
        options.whisper_model, static_cast<int>(std::thread::hardware_concurrency() / 2 + 1));
    if (!recognizer->isReady()) {
        std::cerr << "[parley] Could not load whisper model: " << options.whisper_model << std::endl;
        return 1;
    }

    auto generator = std::make_shared<parley::llm::ConversationEngine>(options.llm_url, config.generation);
    if (!generator->isReady()) {
        std::cerr << "[parley] LLM server not reachable at " << options.llm_url
                  << ", turns will fail until it is up" << std::endl;
    }

    auto synthesizer = std::make_shared<parley::tts::TTSClient>(
        options.tts_url, static_cast<int>(config.synthesis.chunk_timeout.count()));
    if (!synthesizer->isHealthy()) {
        std::cerr << "[parley] TTS server not reachable at " << options.tts_url
                  << ", audio will be replaced by silence" << std::endl;
    }

    parley::audio::AudioConfig audio_config;
    audio_config.sample_rate = config.audio.sample_rate;
    audio_config.channels = 1;
    audio_config.frames_per_buffer = config.audio.sample_rate * config.audio.frame_ms / 1000;
    audio_config.playback_rate = config.synthesis.fallback_sample_rate;
    parley::audio::AudioEngine engine(audio_config);

    const bool verbose = config.log.verbose;
    parley::OutputSinks sinks;
    sinks.onEvent = [&engine, verbose](const parley::PipelineEvent& event) {
        logEvent(event, verbose);
        if (event.type == parley::EventType::TurnStateChanged &&
            event.speaker == parley::Speaker::Assistant &&
            event.turn_state == parley::TurnState::Cancelled) {
            engine.clearPlayback();
        }
    };
    sinks.onAudio = [&engine](const parley::SynthesisChunk& chunk) {
        if (chunk.audio_bytes.empty()) {
            return;
        }
        std::vector<int16_t> samples(chunk.audio_bytes.size() / sizeof(int16_t));
        std::memcpy(samples.data(), chunk.audio_bytes.data(), samples.size() * sizeof(int16_t));
        engine.queuePlayback(samples.data(), samples.size(), chunk.sample_rate);
    };

    parley::session::SessionManager sessions(
        config,
        [&](const std::string& /*session_id*/) {
            parley::Collaborators collaborators;
            collaborators.recognizer = recognizer;
            collaborators.generator = generator;
            collaborators.synthesizer = synthesizer;
            return collaborators;
        },
        sinks);

    const std::string session_id = "local";
    if (!sessions.sessionOpen(session_id)) {
        std::cerr << "[parley] " << sessions.lastError() << std::endl;
        return 1;
    }

    // Microphone → capture ring (PortAudio thread) → pump thread → session
    parley::audio::RingBuffer<int16_t> capture(static_cast<size_t>(config.audio.sample_rate) * 2);
    std::atomic<uint64_t> overruns{0};
    engine.setInputCallback([&capture, &overruns](const int16_t* samples, size_t count) {
        if (capture.push(samples, count) < count) {
            overruns++;
        }
    });

    if (!engine.start()) {
        std::cerr << "[parley] Audio start failed: " << engine.lastError() << std::endl;
        sessions.closeAll();
        return 1;
    }

    std::thread pump([&]() {
        const size_t block = static_cast<size_t>(config.audio.sample_rate * config.audio.frame_ms / 1000);
        std::vector<int16_t> samples(block);
        while (g_running) {
            size_t n = capture.pop(samples.data(), block);
            if (n == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            auto err = sessions.pushAudio(session_id, reinterpret_cast<const uint8_t*>(samples.data()),
                                          n * sizeof(int16_t));
            if (err.code == parley::ErrorCode::SessionClosed) {
                g_running = false;
            }
        }
    });

    std::cout << "[parley] Listening. Press Ctrl+C to stop." << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (sessions.reapExpired() > 0) {
            std::cout << "[parley] Session expired after inactivity" << std::endl;
            g_running = false;
        }
    }

    std::cout << "\n[parley] Shutting down..." << std::endl;
    pump.join();
    engine.stop();
    sessions.closeAll();

    if (overruns > 0) {
        std::cerr << "[parley] Capture overruns: " << overruns.load() << std::endl;
    }
    std::cout << "[parley] Goodbye!" << std::endl;
    return 0;
}
