/**
 * SessionContext.hpp - Per-session conversation history and diarization labels
 *
 * Single writer (the TurnManager). Readers take immutable snapshots.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace parley::session {

class SessionContext {
public:
    using TurnList = std::vector<Turn>;
    using LabelMap = std::map<std::string, std::string>;

    SessionContext(std::string session_id, const ContextConfig& config);

    const std::string& sessionId() const { return session_id_; }

    // --- Writer side -------------------------------------------------------

    /**
     * Append a terminal turn, then evict by max turns, max tokens and max age.
     */
    void appendTurn(const Turn& turn);

    /**
     * Stable label for a raw ASR speaker tag, assigning "Speaker N" on
     * first sight.
     */
    std::string assignSpeakerLabel(const std::string& raw_tag);

    void expire(TimePoint now);
    void clear();

    // --- Reader side -------------------------------------------------------

    std::shared_ptr<const TurnList> snapshot() const;
    std::optional<std::string> speakerLabel(const std::string& raw_tag) const;
    size_t turnCount() const;
    size_t tokenCount() const;

    void touch();
    TimePoint lastActivity() const;
    bool idleExpired(TimePoint now) const;

    static size_t countTokens(const std::string& text);

private:
    void evict(TurnList& turns, TimePoint now) const;

    std::string session_id_;
    ContextConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<const TurnList> turns_;
    std::shared_ptr<const LabelMap> labels_;
    TimePoint last_activity_;
};

} // namespace parley::session
