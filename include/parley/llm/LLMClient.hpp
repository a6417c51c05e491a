/**
 * LLMClient.hpp - HTTP client for a llama.cpp server
 */

#pragma once

#include "parley/core/CancellationToken.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley::llm {

struct CompletionRequest {
    std::string prompt;
    int max_tokens = 512;
    float temperature = 0.7f;
    float top_p = 0.9f;
    std::vector<std::string> stop;
    bool stream = true;
};

struct CompletionResponse {
    std::string content;
    int tokens_generated = 0;
    int tokens_prompt = 0;
    bool stopped = false;
    std::string stop_reason;
    bool cancelled = false;
    int status = 0;         // HTTP status, 0 when no response
    std::string error;      // empty on success

    bool ok() const { return error.empty(); }
};

/**
 * Called per streamed token. Return false to stop the stream.
 */
using StreamCallback = std::function<bool(const std::string& token)>;

class LLMClient {
public:
    LLMClient(const std::string& base_url, int timeout_ms = 60000);
    ~LLMClient();

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    bool isHealthy();

    CompletionResponse complete(const CompletionRequest& request);

    /**
     * Stream a completion. Tokens reach `callback` as they arrive; the
     * connection is torn down promptly once `cancel` is cancelled.
     */
    CompletionResponse completeStreaming(const CompletionRequest& request,
                                         const StreamCallback& callback,
                                         const core::CancellationToken& cancel);

    const std::string& baseUrl() const { return base_url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
    int timeout_ms_;
};

} // namespace parley::llm
