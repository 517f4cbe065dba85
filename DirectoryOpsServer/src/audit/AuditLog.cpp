#include "AuditLog.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <exception>

namespace audit {

bool AuditLog::record(const std::optional<std::string>& actor, const std::string& action,
                      const std::optional<std::string>& target,
                      const std::map<std::string, std::string>& details) {
    AuditEntry e{timeutil::Clock::now(), actor, action, target, details};
    try {
        append(e);
    } catch (const std::exception& ex) {
        observability::log_error("audit.append_failed", {{"action", action},
                                                         {"target", target.value_or(std::string("-"))},
                                                         {"err", std::string(ex.what())}});
        observability::Metrics::instance().count_event("audit", "failed");
        return false;
    }
    observability::log_info("audit", {{"action", action},
                                      {"actor", actor.value_or(std::string("system"))},
                                      {"target", target.value_or(std::string("-"))}});
    observability::Metrics::instance().count_event("audit", "recorded");
    return true;
}

void MemoryAuditLog::append(const AuditEntry& entry) {
    std::lock_guard lock(mu_);
    entries_.push_back(entry);
}

std::vector<AuditEntry> MemoryAuditLog::entries() const {
    std::lock_guard lock(mu_);
    return entries_;
}

std::vector<AuditEntry> MemoryAuditLog::entries_for(const std::string& action) const {
    std::lock_guard lock(mu_);
    std::vector<AuditEntry> out;
    for (const auto& e : entries_) if (e.action == action) out.push_back(e);
    return out;
}

std::size_t MemoryAuditLog::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

}
