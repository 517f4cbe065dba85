#include "Sessions.h"
#include "../auth/Password.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <stdexcept>

namespace session {

const char* to_string(ActionKind k) {
    return k == ActionKind::Reset ? "reset" : "disable";
}

SessionManager::SessionManager(std::chrono::seconds ttl, NowFn now)
    : ttl_(ttl), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

bool SessionManager::expired(const Entry& e, Clock::time_point now) const {
    return ttl_.count() > 0 && now - e.opened >= ttl_;
}

std::size_t SessionManager::purge_locked(Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (expired(it->second, now)) { it = sessions_.erase(it); ++removed; }
        else ++it;
    }
    if (removed) observability::Metrics::instance().count_event("session", "expired");
    return removed;
}

std::string SessionManager::open(PendingAction pending, std::vector<directory::Identity> candidates) {
    if (candidates.size() < 2) throw std::invalid_argument("disambiguation needs at least two candidates");
    auto now = now_();
    std::lock_guard lock(mu_);
    purge_locked(now);
    std::string token;
    do { token = auth::random_token(12); } while (sessions_.count(token));
    observability::log_info("session.open", {{"kind", std::string(to_string(pending.kind))},
                                             {"requested_by", pending.requested_by},
                                             {"candidates", int64_t(candidates.size())}});
    sessions_.emplace(token, Entry{std::move(pending), std::move(candidates), now});
    observability::Metrics::instance().count_event("session", "opened");
    return token;
}

std::optional<Resolution> SessionManager::resolve(const std::string& token, const std::string& chosen_handle) {
    auto now = now_();
    Entry entry;
    {
        std::lock_guard lock(mu_);
        auto it = sessions_.find(token);
        if (it == sessions_.end()) return std::nullopt;
        entry = std::move(it->second);
        sessions_.erase(it);
    }
    if (expired(entry, now)) {
        observability::log_info("session.expired", {{"requested_by", entry.pending.requested_by}});
        observability::Metrics::instance().count_event("session", "expired");
        return std::nullopt;
    }
    for (auto& id : entry.candidates) {
        if (id.handle != chosen_handle) continue;
        observability::Metrics::instance().count_event("session", "resolved");
        return Resolution{std::move(entry.pending), std::move(id)};
    }
    observability::log_warn("session.unknown_choice", {{"handle", chosen_handle}});
    return std::nullopt;
}

bool SessionManager::cancel(const std::string& token) {
    std::lock_guard lock(mu_);
    return sessions_.erase(token) > 0;
}

std::size_t SessionManager::purge_expired() {
    auto now = now_();
    std::lock_guard lock(mu_);
    return purge_locked(now);
}

std::size_t SessionManager::size() const {
    std::lock_guard lock(mu_);
    return sessions_.size();
}

}
