#include "Operators.h"
#include "../audit/AuditLog.h"
#include "../observability/Logging.h"
#include "../text/Utf8.h"

namespace acl {

bool MemoryAdminStore::add(const std::string& user_id, const std::string&) {
    std::lock_guard lock(mu_);
    return ids_.insert(user_id).second;
}

bool MemoryAdminStore::remove(const std::string& user_id) {
    std::lock_guard lock(mu_);
    return ids_.erase(user_id) > 0;
}

bool MemoryAdminStore::contains(const std::string& user_id) {
    std::lock_guard lock(mu_);
    return ids_.count(user_id) > 0;
}

std::vector<std::string> MemoryAdminStore::list() {
    std::lock_guard lock(mu_);
    return std::vector<std::string>(ids_.begin(), ids_.end());
}

const char* to_string(Change c) {
    switch (c) {
        case Change::Added: return "added";
        case Change::Removed: return "removed";
        case Change::Unchanged: return "unchanged";
        case Change::Forbidden: return "forbidden";
        case Change::Protected: return "protected";
        case Change::Invalid: return "invalid";
    }
    return "unknown";
}

Operators::Operators(std::string superadmin_id, std::shared_ptr<AdminStore> store, std::shared_ptr<audit::AuditLog> audit)
    : superadmin_(std::move(superadmin_id)), store_(std::move(store)), audit_(std::move(audit)) {}

bool Operators::is_superadmin(const std::string& principal) const {
    return !superadmin_.empty() && principal == superadmin_;
}

bool Operators::is_operator(const std::string& principal) const {
    if (principal.empty()) return false;
    return is_superadmin(principal) || store_->contains(principal);
}

Change Operators::add_operator(const std::string& actor, const std::string& user_id) {
    if (!is_superadmin(actor)) return Change::Forbidden;
    std::string id = text::trim(user_id);
    if (id.empty()) return Change::Invalid;
    if (is_superadmin(id) || !store_->add(id, actor)) return Change::Unchanged;
    observability::log_info("operators.added", {{"user_id", id}, {"by", actor}});
    audit_->record(actor, "add_admin", id);
    return Change::Added;
}

Change Operators::remove_operator(const std::string& actor, const std::string& user_id) {
    if (!is_superadmin(actor)) return Change::Forbidden;
    std::string id = text::trim(user_id);
    if (id.empty()) return Change::Invalid;
    if (is_superadmin(id)) return Change::Protected;
    if (!store_->remove(id)) return Change::Unchanged;
    observability::log_info("operators.removed", {{"user_id", id}, {"by", actor}});
    audit_->record(actor, "remove_admin", id);
    return Change::Removed;
}

std::vector<std::string> Operators::list_operators() const {
    std::vector<std::string> out;
    if (!superadmin_.empty()) out.push_back(superadmin_);
    for (auto& id : store_->list()) if (id != superadmin_) out.push_back(id);
    return out;
}

}
