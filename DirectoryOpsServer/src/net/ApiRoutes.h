#pragma once

#include "Router.h"
#include <memory>
#include <optional>
#include <string>

namespace service { class OpsService; struct Outcome; }
namespace intake { class MailExtractor; }
namespace jobs { struct Job; }
namespace auth { struct Claims; }

struct ApiContext {
    std::shared_ptr<service::OpsService> service;
    std::shared_ptr<intake::MailExtractor> mail;
    std::string jwt_secret;
    std::string mail_principal;
    bool metrics_enabled = true;
};

// Registers /health, /metrics and the /v1 API on router.
void register_api_routes(Router& router, const ApiContext& ctx);

std::optional<auth::Claims> authenticate(const Request& req, const std::string& jwt_secret);

std::string outcome_to_json(const service::Outcome& o);
std::string job_to_json(const jobs::Job& j);
