#pragma once

#include "../directory/Directory.h"
#include <memory>
#include <string>
#include <vector>

namespace identity {

struct ScoredIdentity {
    directory::Identity identity;
    double score = 0.0;
    bool prefix = false;
};

// Prefix matches on display name or handle first, then descending score. Ties keep input order.
std::vector<ScoredIdentity> rank_candidates(const std::string& query, const std::vector<directory::Identity>& raw);

// Turns a free-text query into a candidate set. Search failures and empty results both
// yield an empty set.
class IdentityResolver {
public:
    explicit IdentityResolver(std::shared_ptr<directory::IdentitySearch> search, std::size_t raw_limit = 100);

    std::vector<directory::Identity> resolve(const std::string& query, std::size_t limit = 10) const;

private:
    std::shared_ptr<directory::IdentitySearch> search_;
    std::size_t raw_limit_;
};

}
