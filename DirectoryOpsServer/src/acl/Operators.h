#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace audit { class AuditLog; }

namespace acl {

// Registry of operator principals besides the superadmin. Throws jobs::PersistenceError
// when the backing store is unreachable.
class AdminStore {
public:
    virtual ~AdminStore() = default;
    virtual bool add(const std::string& user_id, const std::string& added_by) = 0;
    virtual bool remove(const std::string& user_id) = 0;
    virtual bool contains(const std::string& user_id) = 0;
    virtual std::vector<std::string> list() = 0;
};

class MemoryAdminStore : public AdminStore {
public:
    bool add(const std::string& user_id, const std::string& added_by) override;
    bool remove(const std::string& user_id) override;
    bool contains(const std::string& user_id) override;
    std::vector<std::string> list() override;

private:
    std::mutex mu_;
    std::set<std::string> ids_;
};

enum class Change { Added, Removed, Unchanged, Forbidden, Protected, Invalid };

const char* to_string(Change c);

class Operators {
public:
    Operators(std::string superadmin_id, std::shared_ptr<AdminStore> store, std::shared_ptr<audit::AuditLog> audit);

    bool is_superadmin(const std::string& principal) const;
    bool is_operator(const std::string& principal) const;

    // Only the superadmin may change the registry; the superadmin itself cannot be removed.
    Change add_operator(const std::string& actor, const std::string& user_id);
    Change remove_operator(const std::string& actor, const std::string& user_id);

    // Superadmin first, then the registry in order.
    std::vector<std::string> list_operators() const;

    const std::string& superadmin() const { return superadmin_; }

private:
    std::string superadmin_;
    std::shared_ptr<AdminStore> store_;
    std::shared_ptr<audit::AuditLog> audit_;
};

}
