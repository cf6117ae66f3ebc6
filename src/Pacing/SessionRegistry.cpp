#include "Pacing/SessionRegistry.h"
#include "Util/DirectorLog.h"
#include "Util/RandomSource.h"

#include <algorithm>
#include <utility>

namespace
{
constexpr char const* kPacingCategory = "director.pacing";
}

SessionRegistry::SessionRegistry(DirectorConfig config, std::shared_ptr<Clock> clock, DirectorCollaborators collaborators)
    : config_(std::move(config)), clock_(std::move(clock)), collaborators_(std::move(collaborators))
{
}

std::shared_ptr<PacingIntegration> SessionRegistry::GetOrCreate(std::string const& sessionId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end())
        return it->second;

    uint64_t seed = RandomSource::DeriveSeed(config_.randomSeed, sessionId);
    auto session = std::make_shared<PacingIntegration>(sessionId, config_, clock_, collaborators_, seed);
    sessions_.emplace(sessionId, session);
    DIRECTOR_LOG_INFO(kPacingCategory, "[Sessions] Opened session {} ({} live)", sessionId, sessions_.size());
    return session;
}

std::shared_ptr<PacingIntegration> SessionRegistry::Find(std::string const& sessionId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::Drop(std::string const& sessionId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool erased = sessions_.erase(sessionId) > 0;
    if (erased)
        DIRECTOR_LOG_INFO(kPacingCategory, "[Sessions] Closed session {} ({} live)", sessionId, sessions_.size());
    return erased;
}

size_t SessionRegistry::DropStale()
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();)
    {
        if (it->second->IsSessionStale())
        {
            DIRECTOR_LOG_INFO(kPacingCategory, "[Sessions] Dropping stale session {}", it->first);
            it = sessions_.erase(it);
            ++dropped;
        }
        else
        {
            ++it;
        }
    }
    return dropped;
}

size_t SessionRegistry::Size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::SessionIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (auto const& entry : sessions_)
        ids.push_back(entry.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}
