/**
 * ConversationEngine.hpp - Gemma-style chat prompting over LLMClient
 *
 * Stateless with respect to history: the conversation context comes from
 * the session on every call, so one engine can serve many sessions.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/llm/Generator.hpp"
#include "parley/llm/LLMClient.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parley::llm {

class ConversationEngine : public Generator {
public:
    ConversationEngine(const std::string& server_url, const GenerationConfig& config);
    ~ConversationEngine() override;

    bool isReady();

    void setSystemPrompt(const std::string& prompt);

    GenerationResult generate(const std::vector<Turn>& context,
                              const std::string& user_text,
                              const TextChunkCallback& on_chunk,
                              const core::CancellationToken& cancel) override;

    /**
     * Prompt for `user_text` after the completed turns of `context`.
     */
    std::string buildPrompt(const std::vector<Turn>& context, const std::string& user_text) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::llm
