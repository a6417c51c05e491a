/**
 * LLMClient.cpp - HTTP client for llama.cpp server
 *
 * Uses cpp-httplib with Request.content_receiver for true streaming responses.
 */

#include "parley/llm/LLMClient.hpp"

#include <atomic>
#include <iostream>
#include <sstream>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::llm {

struct LLMClient::Impl {
    std::string base_url;
    int timeout_ms;

    Impl(const std::string& url, int timeout) : base_url(url), timeout_ms(timeout) {}

    // One client per request so a cancelled stream can be torn down
    // without disturbing other sessions' requests.
    std::unique_ptr<httplib::Client> makeClient() const {
        auto client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        return client;
    }

    static json toJson(const CompletionRequest& request, bool stream) {
        json req_json = {
            {"prompt", request.prompt},
            {"n_predict", request.max_tokens},
            {"temperature", request.temperature},
            {"top_p", request.top_p},
            {"stream", stream}
        };
        if (!request.stop.empty()) {
            req_json["stop"] = request.stop;
        }
        return req_json;
    }
};

LLMClient::LLMClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(base_url, timeout_ms))
    , base_url_(base_url)
    , timeout_ms_(timeout_ms) {
}

LLMClient::~LLMClient() = default;

bool LLMClient::isHealthy() {
    auto client = impl_->makeClient();
    auto res = client->Get("/health");
    return res && res->status == 200;
}

CompletionResponse LLMClient::complete(const CompletionRequest& request) {
    CompletionResponse response;
    auto client = impl_->makeClient();

    auto res = client->Post("/completion", Impl::toJson(request, false).dump(), "application/json");

    if (!res) {
        response.error = "no response: " + httplib::to_string(res.error());
        std::cerr << "[LLMClient] Request failed: " << response.error << std::endl;
        return response;
    }
    response.status = res->status;
    if (res->status != 200) {
        response.error = "HTTP " + std::to_string(res->status);
        std::cerr << "[LLMClient] Request failed: " << response.error << std::endl;
        return response;
    }

    try {
        json res_json = json::parse(res->body);
        response.content = res_json.value("content", "");
        response.tokens_generated = res_json.value("tokens_predicted", 0);
        response.tokens_prompt = res_json.value("tokens_evaluated", 0);
        response.stopped = res_json.value("stopped_eos", false) ||
                           res_json.value("stopped_word", false);
        response.stop_reason = res_json.value("stopping_word", "");
    } catch (const std::exception& e) {
        response.error = std::string("JSON parse error: ") + e.what();
        std::cerr << "[LLMClient] " << response.error << std::endl;
    }

    return response;
}

CompletionResponse LLMClient::completeStreaming(const CompletionRequest& request,
                                                const StreamCallback& callback,
                                                const core::CancellationToken& cancel) {
    CompletionResponse response;
    std::stringstream full_content;
    auto client = impl_->makeClient();

    bool should_stop = false;
    std::string buffer;

    httplib::Request req;
    req.method = "POST";
    req.path = "/completion";
    req.set_header("Content-Type", "application/json");
    req.body = Impl::toJson(request, true).dump();

    req.response_handler = [&](const httplib::Response& res) {
        response.status = res.status;
        return res.status == 200;
    };

    // Called as data arrives
    req.content_receiver = [&](const char* data, size_t data_length,
                               uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
        if (should_stop || cancel.isCancelled()) return false;

        buffer.append(data, data_length);

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) continue;

            std::string json_str = line;

            // SSE framing (data: prefix)
            if (line.rfind("data: ", 0) == 0) {
                json_str = line.substr(6);
            }

            if (json_str == "[DONE]") {
                response.stopped = true;
                continue;
            }

            try {
                json data_json = json::parse(json_str);
                std::string token = data_json.value("content", "");

                if (!token.empty()) {
                    full_content << token;
                    response.tokens_generated++;

                    if (callback && !callback(token)) {
                        should_stop = true;
                        return false;
                    }
                }

                if (data_json.value("stop", false)) {
                    response.stopped = true;
                    response.stop_reason = data_json.value("stopping_word", "");
                }
            } catch (const std::exception& e) {
                std::cerr << "[LLMClient] Parse error: " << e.what()
                          << " - data: " << json_str.substr(0, 100) << std::endl;
            }
        }

        return true;
    };

    // Tears the connection down when the token fires mid-read
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished) {
            if (cancel.waitFor(std::chrono::milliseconds(20))) {
                client->stop();
                return;
            }
        }
    });

    auto result = client->send(req);

    finished = true;
    watcher.join();

    response.content = full_content.str();
    response.cancelled = cancel.isCancelled();

    if (response.cancelled || should_stop) {
        return response;
    }
    if (response.status != 0 && response.status != 200) {
        response.error = "HTTP " + std::to_string(response.status);
    } else if (!result) {
        response.error = httplib::to_string(result.error());
    }
    if (!response.ok()) {
        std::cerr << "[LLMClient] Streaming request failed: " << response.error << std::endl;
    }

    return response;
}

} // namespace parley::llm
