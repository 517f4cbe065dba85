#pragma once

#include "../directory/Directory.h"
#include "../timeutil/Time.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace session {

enum class ActionKind { Reset, Disable };

const char* to_string(ActionKind k);

// What the requester asked for, waiting for a single identity.
struct PendingAction {
    ActionKind kind = ActionKind::Disable;
    std::string target_query;
    std::string requested_by;
    std::optional<timeutil::TimePoint> scheduled_for;
    std::string source = "chat";
};

struct Resolution {
    PendingAction pending;
    directory::Identity identity;
};

// Single-use disambiguation tokens, process-local.
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    // ttl of zero keeps sessions until they are used.
    explicit SessionManager(std::chrono::seconds ttl = std::chrono::seconds(0), NowFn now = {});

    // Throws std::invalid_argument unless there are at least two candidates.
    std::string open(PendingAction pending, std::vector<directory::Identity> candidates);

    // Removes the session whatever the outcome. Unknown token, expired session or a handle
    // that is not among the candidates all give nullopt.
    std::optional<Resolution> resolve(const std::string& token, const std::string& chosen_handle);

    bool cancel(const std::string& token);
    std::size_t purge_expired();
    std::size_t size() const;

private:
    struct Entry {
        PendingAction pending;
        std::vector<directory::Identity> candidates;
        Clock::time_point opened;
    };

    bool expired(const Entry& e, Clock::time_point now) const;
    std::size_t purge_locked(Clock::time_point now);

    std::chrono::seconds ttl_;
    NowFn now_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> sessions_;
};

}
