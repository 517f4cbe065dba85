#include "Callback.h"

#include <cctype>

namespace intake {

namespace {

bool valid_token(const std::string& s) {
    if (s.empty() || s.size() > 64) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool valid_handle(const std::string& s) {
    if (s.empty() || s.size() > 64) return false;
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '.' && c != '-' && c != '$' && c != '@') return false;
    }
    return true;
}

}

std::optional<CallbackPayload> parse_callback(const std::string& data) {
    static const std::string sel = "sel:";
    static const std::string cancel = "cancel:";
    if (data.compare(0, sel.size(), sel) == 0) {
        auto rest = data.substr(sel.size());
        auto colon = rest.find(':');
        if (colon == std::string::npos) return std::nullopt;
        SelectCandidate p{rest.substr(0, colon), rest.substr(colon + 1)};
        if (!valid_token(p.token) || !valid_handle(p.handle)) return std::nullopt;
        return CallbackPayload{p};
    }
    if (data.compare(0, cancel.size(), cancel) == 0) {
        CancelSelection p{data.substr(cancel.size())};
        if (!valid_token(p.token)) return std::nullopt;
        return CallbackPayload{p};
    }
    return std::nullopt;
}

std::string format_callback(const CallbackPayload& payload) {
    if (auto s = std::get_if<SelectCandidate>(&payload)) return "sel:" + s->token + ":" + s->handle;
    return "cancel:" + std::get<CancelSelection>(payload).token;
}

}
