#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace directory {

// Snapshot of a directory account as returned by a search.
struct Identity {
    std::string handle;
    std::string display_name;
    std::string path;
    bool enabled = true;

    // "Display Name (handle)"
    std::string label() const;
};

class DirectoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raw search. Results are unranked; errors are thrown as DirectoryError.
class IdentitySearch {
public:
    virtual ~IdentitySearch() = default;
    virtual std::vector<Identity> search(const std::string& query, std::size_t max_results) = 0;
};

enum class ActionType { ResetPassword, DisableAccount };

const char* to_string(ActionType t);

struct ActionRequest {
    ActionType type = ActionType::DisableAccount;
    std::string target;
    std::string new_password;
    bool must_change_password = true;
};

struct ActionResult {
    bool ok = false;
    bool timed_out = false;
    std::string reason;

    static ActionResult success(std::string detail = {});
    static ActionResult failure(std::string reason, bool timed_out = false);
};

// Performs an action against the directory. May block; implementations bound their own runtime.
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual ActionResult perform(const ActionRequest& req) = 0;
};

}
