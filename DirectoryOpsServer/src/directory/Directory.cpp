#include "Directory.h"

namespace directory {

std::string Identity::label() const {
    if (display_name.empty()) return handle;
    return display_name + " (" + handle + ")";
}

const char* to_string(ActionType t) {
    switch (t) {
        case ActionType::ResetPassword: return "reset_password";
        case ActionType::DisableAccount: return "disable_account";
    }
    return "unknown";
}

ActionResult ActionResult::success(std::string detail) {
    ActionResult r;
    r.ok = true;
    r.reason = std::move(detail);
    return r;
}

ActionResult ActionResult::failure(std::string reason, bool timed_out) {
    ActionResult r;
    r.ok = false;
    r.timed_out = timed_out;
    r.reason = std::move(reason);
    return r;
}

}
