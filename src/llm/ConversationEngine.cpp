/**
 * ConversationEngine.cpp - Gemma 3 conversation prompting
 */

#include "parley/llm/ConversationEngine.hpp"

#include <iostream>
#include <mutex>
#include <sstream>

namespace parley::llm {

static const char* DEFAULT_SYSTEM_PROMPT = R"(You are a friendly, helpful voice assistant.
Answer naturally and concisely; your replies are read aloud.
When you do not know something, say so honestly.
IMPORTANT: Never use emojis, markdown or lists in your answers.)";

struct ConversationEngine::Impl {
    LLMClient client;
    GenerationConfig config;
    mutable std::mutex prompt_mutex;
    std::string system_prompt;

    Impl(const std::string& server_url, const GenerationConfig& cfg)
        : client(server_url, 60000)
        , config(cfg)
        , system_prompt(cfg.system_prompt.empty() ? DEFAULT_SYSTEM_PROMPT : cfg.system_prompt) {
    }
};

ConversationEngine::ConversationEngine(const std::string& server_url, const GenerationConfig& config)
    : impl_(std::make_unique<Impl>(server_url, config)) {
    std::cout << "[ConversationEngine] Connecting to " << server_url << std::endl;
}

ConversationEngine::~ConversationEngine() = default;

bool ConversationEngine::isReady() {
    return impl_->client.isHealthy();
}

void ConversationEngine::setSystemPrompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(impl_->prompt_mutex);
    impl_->system_prompt = prompt;
}

std::string ConversationEngine::buildPrompt(const std::vector<Turn>& context,
                                            const std::string& user_text) const {
    std::stringstream prompt;

    // Gemma 3 instruction format
    prompt << "<start_of_turn>user\n";
    {
        std::lock_guard<std::mutex> lock(impl_->prompt_mutex);
        prompt << impl_->system_prompt << "\n\n";
    }

    for (const auto& turn : context) {
        if (turn.state != TurnState::Completed || turn.text.empty()) {
            continue;
        }
        prompt << (turn.speaker == Speaker::User ? "User: " : "Assistant: ") << turn.text << "\n";
    }

    prompt << "User: " << user_text << "\n";
    prompt << "<end_of_turn>\n";
    prompt << "<start_of_turn>model\n";
    prompt << "Assistant: ";

    return prompt.str();
}

GenerationResult ConversationEngine::generate(const std::vector<Turn>& context,
                                              const std::string& user_text,
                                              const TextChunkCallback& on_chunk,
                                              const core::CancellationToken& cancel) {
    CompletionRequest request;
    request.prompt = buildPrompt(context, user_text);
    request.max_tokens = impl_->config.max_tokens;
    request.temperature = impl_->config.temperature;
    request.stop = {"<end_of_turn>", "User:", "\n\n"};
    request.stream = true;

    GenerationResult result;
    auto response = impl_->client.completeStreaming(request, [&](const std::string& token) {
        ++result.chunks;
        return on_chunk ? on_chunk(token) : true;
    }, cancel);

    if (response.cancelled) {
        result.error = ErrorCode::CancellationRace;
        result.error_message = "cancelled";
    } else if (!response.ok()) {
        result.error = ErrorCode::GenerationError;
        result.error_message = response.error;
    }
    return result;
}

} // namespace parley::llm
