
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "session/Sessions.h"

using directory::Identity;
using session::SessionManager;

static std::vector<Identity> two_ivanovas() {
    return {{"nivanova", "Иванова Наталья", "", true}, {"mivanova", "Иванова Мария", "", true}};
}

static session::PendingAction disable_request() {
    session::PendingAction p;
    p.kind = session::ActionKind::Disable;
    p.target_query = "Иванова";
    p.requested_by = "1001";
    return p;
}

int main() {
    {
        SessionManager sm;
        try {
            sm.open(disable_request(), {{"alice", "Alice Smith", "", true}});
            std::cerr << "open with one candidate should throw\n";
            return 1;
        } catch (const std::invalid_argument&) {}
        if (sm.size() != 0) { std::cerr << "failed open left a session\n"; return 1; }
    }

    {
        SessionManager sm;
        std::string token = sm.open(disable_request(), two_ivanovas());
        if (token.size() != 24) { std::cerr << "unexpected token length " << token.size() << "\n"; return 1; }
        if (sm.size() != 1) { std::cerr << "session not stored\n"; return 1; }

        auto r = sm.resolve(token, "mivanova");
        if (!r) { std::cerr << "resolve failed\n"; return 1; }
        if (r->identity.handle != "mivanova" || r->pending.requested_by != "1001" || r->pending.kind != session::ActionKind::Disable) {
            std::cerr << "resolution content mismatch\n"; return 1;
        }
        if (sm.resolve(token, "mivanova")) { std::cerr << "token should be single-use\n"; return 1; }
        if (sm.size() != 0) { std::cerr << "used session not removed\n"; return 1; }
    }

    {
        SessionManager sm;
        std::string token = sm.open(disable_request(), two_ivanovas());
        if (sm.resolve(token, "ppetrov")) { std::cerr << "handle outside candidates accepted\n"; return 1; }
        if (sm.resolve(token, "nivanova")) { std::cerr << "session should be consumed by a bad choice\n"; return 1; }
        if (sm.resolve("deadbeef", "nivanova")) { std::cerr << "unknown token accepted\n"; return 1; }
    }

    {
        SessionManager sm;
        std::string token = sm.open(disable_request(), two_ivanovas());
        if (!sm.cancel(token)) { std::cerr << "cancel of live session failed\n"; return 1; }
        if (sm.cancel(token)) { std::cerr << "double cancel succeeded\n"; return 1; }
        if (sm.resolve(token, "nivanova")) { std::cerr << "cancelled token resolved\n"; return 1; }
    }

    {
        SessionManager sm;
        std::set<std::string> tokens;
        for (int i = 0; i < 20; ++i) tokens.insert(sm.open(disable_request(), two_ivanovas()));
        if (tokens.size() != 20 || sm.size() != 20) { std::cerr << "tokens not unique\n"; return 1; }
    }

    {
        auto now = SessionManager::Clock::now();
        SessionManager sm(std::chrono::seconds(60), [&now] { return now; });
        std::string a = sm.open(disable_request(), two_ivanovas());
        now += std::chrono::seconds(30);
        std::string b = sm.open(disable_request(), two_ivanovas());
        now += std::chrono::seconds(31);
        if (sm.resolve(a, "nivanova")) { std::cerr << "expired session resolved\n"; return 1; }
        if (sm.purge_expired() != 0) { std::cerr << "second session should still be live\n"; return 1; }
        if (!sm.resolve(b, "nivanova")) { std::cerr << "live session did not resolve\n"; return 1; }

        sm.open(disable_request(), two_ivanovas());
        now += std::chrono::hours(1);
        if (sm.purge_expired() != 1 || sm.size() != 0) { std::cerr << "purge_expired did not remove stale session\n"; return 1; }
    }

    {
        auto now = SessionManager::Clock::now();
        SessionManager sm(std::chrono::seconds(0), [&now] { return now; });
        std::string t = sm.open(disable_request(), two_ivanovas());
        now += std::chrono::hours(24 * 30);
        if (sm.purge_expired() != 0 || !sm.resolve(t, "nivanova")) { std::cerr << "ttl 0 should never expire\n"; return 1; }
    }

    std::cout << "sessions_unit ok\n";
    return 0;
}
