#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Pacing/PacingIntegration.h"
#include "Util/Clock.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Owns one PacingIntegration per live session. The registry lock covers the
// map only and is never held while a session lock is taken.
class SessionRegistry
{
public:
    SessionRegistry(DirectorConfig config, std::shared_ptr<Clock> clock, DirectorCollaborators collaborators);

    std::shared_ptr<PacingIntegration> GetOrCreate(std::string const& sessionId);
    std::shared_ptr<PacingIntegration> Find(std::string const& sessionId) const;
    bool Drop(std::string const& sessionId);
    // Drop every session with no input inside the stale window. Returns how many
    // went. Reads each session's last-input time only, so busy sessions never block it.
    size_t DropStale();

    size_t Size() const;
    std::vector<std::string> SessionIds() const;

private:
    DirectorConfig config_;
    std::shared_ptr<Clock> clock_;
    DirectorCollaborators collaborators_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PacingIntegration>> sessions_;
};
