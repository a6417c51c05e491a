/**
 * SessionContext.cpp - Bounded, append-only conversation window
 */

#include "parley/session/SessionContext.hpp"

#include <iostream>
#include <sstream>

namespace parley::session {

SessionContext::SessionContext(std::string session_id, const ContextConfig& config)
    : session_id_(std::move(session_id))
    , config_(config)
    , turns_(std::make_shared<const TurnList>())
    , labels_(std::make_shared<const LabelMap>())
    , last_activity_(Clock::now())
{
}

size_t SessionContext::countTokens(const std::string& text) {
    std::istringstream stream(text);
    size_t count = 0;
    std::string word;
    while (stream >> word) {
        ++count;
    }
    return count;
}

void SessionContext::appendTurn(const Turn& turn) {
    std::shared_ptr<const TurnList> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = turns_;
    }

    auto next = std::make_shared<TurnList>(*current);
    next->push_back(turn);
    evict(*next, Clock::now());

    std::lock_guard<std::mutex> lock(mutex_);
    turns_ = std::move(next);
}

void SessionContext::evict(TurnList& turns, TimePoint now) const {
    size_t evicted = 0;

    while (!turns.empty()) {
        const Turn& oldest = turns.front();
        TimePoint ended = oldest.ended_at.value_or(oldest.started_at);
        if (now - ended <= config_.max_age) {
            break;
        }
        turns.erase(turns.begin());
        ++evicted;
    }

    while (turns.size() > config_.max_turns) {
        turns.erase(turns.begin());
        ++evicted;
    }

    size_t tokens = 0;
    for (const auto& t : turns) {
        tokens += countTokens(t.text);
    }
    // Always keep the newest turn, even if it alone exceeds the budget
    while (turns.size() > 1 && tokens > config_.max_tokens) {
        tokens -= countTokens(turns.front().text);
        turns.erase(turns.begin());
        ++evicted;
    }

    if (evicted > 0) {
        std::cout << "[SessionContext] " << session_id_ << ": evicted " << evicted
                  << " turn(s), " << turns.size() << " remain" << std::endl;
    }
}

std::string SessionContext::assignSpeakerLabel(const std::string& raw_tag) {
    std::shared_ptr<const LabelMap> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = labels_;
    }

    auto it = current->find(raw_tag);
    if (it != current->end()) {
        return it->second;
    }

    auto next = std::make_shared<LabelMap>(*current);
    std::string label = "Speaker " + std::to_string(next->size() + 1);
    (*next)[raw_tag] = label;

    std::lock_guard<std::mutex> lock(mutex_);
    labels_ = std::move(next);
    return label;
}

void SessionContext::expire(TimePoint now) {
    std::shared_ptr<const TurnList> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = turns_;
    }

    auto next = std::make_shared<TurnList>(*current);
    evict(*next, now);
    if (next->size() == current->size()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    turns_ = std::move(next);
}

void SessionContext::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_ = std::make_shared<const TurnList>();
    labels_ = std::make_shared<const LabelMap>();
}

std::shared_ptr<const SessionContext::TurnList> SessionContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_;
}

std::optional<std::string> SessionContext::speakerLabel(const std::string& raw_tag) const {
    std::shared_ptr<const LabelMap> labels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        labels = labels_;
    }
    auto it = labels->find(raw_tag);
    if (it == labels->end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SessionContext::turnCount() const {
    return snapshot()->size();
}

size_t SessionContext::tokenCount() const {
    size_t tokens = 0;
    for (const auto& t : *snapshot()) {
        tokens += countTokens(t.text);
    }
    return tokens;
}

void SessionContext::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = Clock::now();
}

TimePoint SessionContext::lastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

bool SessionContext::idleExpired(TimePoint now) const {
    return now - lastActivity() > config_.session_idle_expiry;
}

} // namespace parley::session
