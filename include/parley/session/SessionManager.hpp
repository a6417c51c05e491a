/**
 * SessionManager.hpp - Transport boundary: session lifecycle and audio routing
 *
 * Each session owns an independent Orchestrator; sessions share no mutable
 * state. Events and audio from every session go to the same sinks and are
 * told apart by session id.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Events.hpp"
#include "parley/Orchestrator.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley::session {

class SessionManager {
public:
    using CollaboratorFactory = std::function<Collaborators(const std::string& session_id)>;

    SessionManager(const PipelineConfig& config, CollaboratorFactory factory, OutputSinks sinks);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Open a session with the default config.
     * @return false if the id is in use or the pipeline failed to start
     */
    bool sessionOpen(const std::string& session_id);
    bool sessionOpen(const std::string& session_id, const PipelineConfig& config);

    /**
     * Route raw audio to a session. Unknown or closed sessions yield SessionClosed.
     */
    PipelineError pushAudio(const std::string& session_id, const uint8_t* data, size_t size);

    bool sessionClose(const std::string& session_id);

    /**
     * Close every session idle for longer than its configured expiry.
     * @return number of sessions closed
     */
    size_t reapExpired(TimePoint now = Clock::now());

    void closeAll();

    std::shared_ptr<Orchestrator> find(const std::string& session_id) const;
    std::vector<std::string> sessionIds() const;
    size_t sessionCount() const;
    std::string lastError() const;

private:
    PipelineConfig config_;
    CollaboratorFactory factory_;
    OutputSinks sinks_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Orchestrator>> sessions_;
    std::string last_error_;
};

} // namespace parley::session
