#include "Resolver.h"
#include "Fuzzy.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../text/Utf8.h"

#include <algorithm>
#include <unordered_set>

namespace identity {

std::vector<ScoredIdentity> rank_candidates(const std::string& query, const std::vector<directory::Identity>& raw) {
    std::vector<ScoredIdentity> out;
    out.reserve(raw.size());
    std::unordered_set<std::string> seen;
    for (const auto& id : raw) {
        if (id.handle.empty()) continue;
        if (!seen.insert(text::fold_utf8(id.handle)).second) continue;
        ScoredIdentity s;
        s.identity = id;
        s.score = std::max({weighted_ratio(query, id.label()),
                            weighted_ratio(query, id.display_name),
                            weighted_ratio(query, id.handle)});
        s.prefix = starts_with_normalized(id.display_name, query) || starts_with_normalized(id.handle, query);
        out.push_back(std::move(s));
    }
    std::stable_sort(out.begin(), out.end(), [](const ScoredIdentity& a, const ScoredIdentity& b) {
        if (a.prefix != b.prefix) return a.prefix;
        return a.score > b.score;
    });
    return out;
}

IdentityResolver::IdentityResolver(std::shared_ptr<directory::IdentitySearch> search, std::size_t raw_limit)
    : search_(std::move(search)), raw_limit_(raw_limit) {}

std::vector<directory::Identity> IdentityResolver::resolve(const std::string& query, std::size_t limit) const {
    std::vector<directory::Identity> result;
    std::string q = text::trim(query);
    if (q.empty() || limit == 0) return result;

    std::vector<directory::Identity> raw;
    try {
        raw = search_->search(q, raw_limit_);
    } catch (const std::exception& e) {
        observability::log_warn("resolver.search_failed", {{"query", q}, {"err", std::string(e.what())}});
        observability::Metrics::instance().count_event("resolve", "error");
        return result;
    }
    if (raw.size() > raw_limit_) raw.resize(raw_limit_);

    auto ranked = rank_candidates(q, raw);
    for (auto& s : ranked) {
        if (result.size() >= limit) break;
        result.push_back(std::move(s.identity));
    }
    observability::log_debug("resolver.resolved", {{"query", q}, {"raw", int64_t(raw.size())}, {"candidates", int64_t(result.size())}});
    observability::Metrics::instance().count_event("resolve", result.empty() ? "empty" : "found");
    return result;
}

}
