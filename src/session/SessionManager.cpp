/**
 * SessionManager.cpp - Session lifecycle and audio routing
 */

#include "parley/session/SessionManager.hpp"

#include <iostream>

namespace parley::session {

SessionManager::SessionManager(const PipelineConfig& config, CollaboratorFactory factory, OutputSinks sinks)
    : config_(config)
    , factory_(std::move(factory))
    , sinks_(std::move(sinks))
{
}

SessionManager::~SessionManager() {
    closeAll();
}

bool SessionManager::sessionOpen(const std::string& session_id) {
    return sessionOpen(session_id, config_);
}

bool SessionManager::sessionOpen(const std::string& session_id, const PipelineConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(session_id) > 0) {
            last_error_ = "session " + session_id + " already open";
            std::cerr << "[SessionManager] " << last_error_ << std::endl;
            return false;
        }
    }

    Collaborators collaborators;
    if (factory_) {
        collaborators = factory_(session_id);
    }

    auto orchestrator = std::make_shared<Orchestrator>(session_id, config, std::move(collaborators), sinks_);
    if (!orchestrator->start()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "session " + session_id + ": " + orchestrator->lastError();
        std::cerr << "[SessionManager] " << last_error_ << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(session_id, orchestrator).second) {
        last_error_ = "session " + session_id + " opened concurrently";
        std::cerr << "[SessionManager] " << last_error_ << std::endl;
        return false;
    }
    std::cout << "[SessionManager] session " << session_id << " opened ("
              << sessions_.size() << " active)" << std::endl;
    return true;
}

PipelineError SessionManager::pushAudio(const std::string& session_id, const uint8_t* data, size_t size) {
    auto orchestrator = find(session_id);
    if (!orchestrator) {
        return {ErrorCode::SessionClosed, "unknown session " + session_id};
    }
    return orchestrator->pushAudio(data, size);
}

bool SessionManager::sessionClose(const std::string& session_id) {
    std::shared_ptr<Orchestrator> orchestrator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        orchestrator = std::move(it->second);
        sessions_.erase(it);
    }
    orchestrator->close();
    std::cout << "[SessionManager] session " << session_id << " closed" << std::endl;
    return true;
}

size_t SessionManager::reapExpired(TimePoint now) {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, orchestrator] : sessions_) {
            if (orchestrator->context().idleExpired(now)) {
                expired.push_back(id);
            }
        }
    }
    size_t closed = 0;
    for (const auto& id : expired) {
        std::cout << "[SessionManager] session " << id << " idle, expiring" << std::endl;
        if (sessionClose(id)) {
            ++closed;
        }
    }
    return closed;
}

void SessionManager::closeAll() {
    std::map<std::string, std::shared_ptr<Orchestrator>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, orchestrator] : sessions) {
        orchestrator->close();
    }
}

std::shared_ptr<Orchestrator> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> SessionManager::sessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, orchestrator] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionManager::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::string SessionManager::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace parley::session
