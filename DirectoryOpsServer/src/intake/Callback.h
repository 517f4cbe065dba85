#pragma once

#include <optional>
#include <string>
#include <variant>

namespace intake {

struct SelectCandidate {
    std::string token;
    std::string handle;
};

struct CancelSelection {
    std::string token;
};

using CallbackPayload = std::variant<SelectCandidate, CancelSelection>;

// "sel:<token>:<handle>" or "cancel:<token>". Anything else is nullopt.
std::optional<CallbackPayload> parse_callback(const std::string& data);
std::string format_callback(const CallbackPayload& payload);

}
