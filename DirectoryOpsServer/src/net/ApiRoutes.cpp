#include "ApiRoutes.h"
#include "MiniJson.h"
#include "../acl/Operators.h"
#include "../auth/Jwt.h"
#include "../intake/MailExtractor.h"
#include "../jobs/Job.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../service/OpsService.h"
#include "../timeutil/Time.h"

#include <functional>

#include <stdexcept>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

namespace {

struct BadRequest : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct HttpError {
    http::status status;
    std::string error;
};

std::string error_body(const std::string& error, const std::string& message = std::string()) {
    std::string out = "{\"error\":\"" + json_escape_resp(error) + "\"";
    if (!message.empty()) out += ",\"message\":\"" + json_escape_resp(message) + "\"";
    return out + "}";
}

std::string required_string(const std::string& body, const std::string& key) {
    std::pair<bool, std::string> v;
    try {
        v = json_extract_string_present(body, key);
    } catch (const std::runtime_error& e) {
        throw BadRequest(e.what());
    }
    if (!v.first || v.second.empty()) throw BadRequest("missing field " + key);
    return v.second;
}

std::optional<std::string> optional_string(const std::string& body, const std::string& key) {
    try {
        auto v = json_extract_string_opt_present(body, key);
        if (!v.first || !v.second || v.second->empty()) return std::nullopt;
        return v.second;
    } catch (const std::runtime_error& e) {
        throw BadRequest(e.what());
    }
}

using AuthedHandler = std::function<Response(const Request&, const auth::Claims&)>;

Router::Handler guarded(const ApiContext& ctx, AuthedHandler h) {
    std::string secret = ctx.jwt_secret;
    return [secret, h](const Request& req) -> Response {
        auto claims = authenticate(req, secret);
        if (!claims) return make_json_response(http::status::unauthorized, req, error_body("unauthorized"));
        try {
            return h(req, *claims);
        } catch (const BadRequest& e) {
            return make_json_response(http::status::bad_request, req, error_body("bad_request", e.what()));
        } catch (const jobs::PersistenceError& e) {
            observability::log_error("api.persistence_failure", {{"path", std::string(req.target())}, {"err", std::string(e.what())}});
            return make_json_response(http::status::service_unavailable, req, error_body("persistence_failure"));
        } catch (const std::invalid_argument& e) {
            return make_json_response(http::status::bad_request, req, error_body("bad_request", e.what()));
        }
    };
}

http::status status_for(const service::Outcome& o) {
    switch (o.kind) {
        case service::Outcome::Kind::Denied: return http::status::forbidden;
        case service::Outcome::Kind::Failed: return http::status::bad_gateway;
        default: return http::status::ok;
    }
}

std::string identity_to_json(const directory::Identity& id) {
    return "{\"handle\":\"" + json_escape_resp(id.handle) + "\",\"display_name\":\"" + json_escape_resp(id.display_name) +
           "\",\"path\":\"" + json_escape_resp(id.path) + "\",\"enabled\":" + (id.enabled ? "true" : "false") + "}";
}

std::string string_list(const std::vector<std::string>& v) {
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += "\"" + json_escape_resp(v[i]) + "\"";
    }
    return out + "]";
}

}

std::optional<auth::Claims> authenticate(const Request& req, const std::string& jwt_secret) {
    auto it = req.find(http::field::authorization);
    if (it == req.end()) return std::nullopt;
    auto token = auth::bearer_token(std::string(it->value()));
    if (!token) return std::nullopt;
    return auth::verify_jwt(*token, jwt_secret);
}

std::string job_to_json(const jobs::Job& j) {
    std::string out = "{\"id\":" + std::to_string(j.id);
    out += ",\"type\":\"" + std::string(jobs::to_string(j.type)) + "\"";
    out += ",\"target\":\"" + json_escape_resp(j.target_handle) + "\"";
    out += ",\"run_at\":\"" + timeutil::format_iso_z(j.run_at) + "\"";
    out += ",\"run_at_local\":\"" + timeutil::format_local(j.run_at) + "\"";
    out += ",\"status\":\"" + std::string(jobs::to_string(j.status)) + "\"";
    out += ",\"created_by\":\"" + json_escape_resp(j.created_by) + "\"";
    out += ",\"metadata\":" + json_emit_string_map(j.metadata);
    out += ",\"last_error\":" + json_emit_string_or_null(j.last_error.empty() ? std::nullopt : std::optional<std::string>(j.last_error));
    return out + "}";
}

std::string outcome_to_json(const service::Outcome& o) {
    std::string out = "{\"outcome\":\"" + std::string(service::to_string(o.kind)) + "\"";
    out += ",\"message\":\"" + json_escape_resp(o.message) + "\"";
    if (o.identity) out += ",\"identity\":" + identity_to_json(*o.identity);
    if (!o.choices.empty()) {
        out += ",\"choices\":[";
        for (std::size_t i = 0; i < o.choices.size(); ++i) {
            if (i) out += ",";
            out += "{\"label\":\"" + json_escape_resp(o.choices[i].label) + "\",\"data\":\"" + json_escape_resp(o.choices[i].data) + "\"}";
        }
        out += "],\"cancel\":\"" + json_escape_resp(o.cancel_data) + "\"";
    }
    if (o.kind == service::Outcome::Kind::PasswordReset) out += ",\"password\":\"" + json_escape_resp(o.password) + "\"";
    if (o.kind == service::Outcome::Kind::Scheduled && o.run_at) {
        out += ",\"job\":{\"id\":" + std::to_string(o.job_id) + ",\"created\":" + (o.job_created ? "true" : "false") +
               ",\"run_at\":\"" + timeutil::format_iso_z(*o.run_at) + "\",\"run_at_local\":\"" + timeutil::format_local(*o.run_at) + "\"}";
    }
    if (o.kind == service::Outcome::Kind::Jobs) {
        out += ",\"jobs\":[";
        for (std::size_t i = 0; i < o.jobs.size(); ++i) {
            if (i) out += ",";
            out += job_to_json(o.jobs[i]);
        }
        out += "]";
    }
    return out + "}";
}

void register_api_routes(Router& router, const ApiContext& ctx) {
    auto svc = ctx.service;
    auto mail = ctx.mail;
    std::string mail_principal = ctx.mail_principal;

    router.add_route("GET", "/health", [](const Request& req) {
        return make_json_response(http::status::ok, req, "{\"status\":\"ok\"}");
    });

    if (ctx.metrics_enabled) {
        router.add_route("GET", "/metrics", [](const Request& req) {
            Response res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/plain; version=0.0.4");
            res.keep_alive(req.keep_alive());
            res.body() = observability::Metrics::instance().scrape();
            res.prepare_payload();
            return res;
        });
    }

    router.add_route("POST", "/v1/requests/text", guarded(ctx, [svc](const Request& req, const auth::Claims& c) {
        auto o = svc->handle_text(c.sub, required_string(req.body(), "text"));
        return make_json_response(status_for(o), req, outcome_to_json(o));
    }));

    router.add_route("POST", "/v1/requests/mail", guarded(ctx, [svc, mail, mail_principal](const Request& req, const auth::Claims& c) {
        if (c.sub != mail_principal && !svc->operators().is_operator(c.sub)) {
            return make_json_response(http::status::forbidden, req, error_body("forbidden"));
        }
        const std::string& body = req.body();
        std::optional<intake::MailEvent> ev;
        if (auto text = optional_string(body, "text")) {
            ev = mail->extract(*text);
            if (!ev) {
                service::Outcome o;
                o.kind = service::Outcome::Kind::Unrecognized;
                o.message = "Not an offboarding notice";
                return make_json_response(http::status::ok, req, outcome_to_json(o));
            }
        } else {
            intake::MailEvent e;
            e.name = optional_string(body, "name").value_or(std::string());
            e.handle = optional_string(body, "handle").value_or(std::string());
            if (e.name.empty() && e.handle.empty()) throw BadRequest("name or handle required");
            auto date = timeutil::parse_date(required_string(body, "date"));
            if (!date) throw BadRequest("invalid date");
            e.date = *date;
            ev = e;
        }
        auto o = svc->handle_mail(*ev);
        return make_json_response(status_for(o), req, outcome_to_json(o));
    }));

    router.add_route("POST", "/v1/callbacks", guarded(ctx, [svc](const Request& req, const auth::Claims& c) {
        auto o = svc->handle_callback(c.sub, required_string(req.body(), "data"));
        return make_json_response(status_for(o), req, outcome_to_json(o));
    }));

    router.add_route("GET", "/v1/jobs", guarded(ctx, [svc](const Request& req, const auth::Claims& c) {
        auto o = svc->list_jobs(c.sub);
        return make_json_response(status_for(o), req, outcome_to_json(o));
    }));

    router.add_route("GET", "/v1/whoami", guarded(ctx, [svc](const Request& req, const auth::Claims& c) {
        auto w = svc->whoami(c.sub);
        std::string body = "{\"principal\":\"" + json_escape_resp(w.principal) + "\",\"name\":\"" + json_escape_resp(c.name) +
                           "\",\"operator\":" + (w.is_operator ? "true" : "false") +
                           ",\"superadmin\":" + (w.is_superadmin ? "true" : "false") + "}";
        return make_json_response(http::status::ok, req, body);
    }));

    router.add_route("GET", "/v1/admins", guarded(ctx, [svc](const Request& req, const auth::Claims& c) {
        if (!svc->operators().is_operator(c.sub)) return make_json_response(http::status::forbidden, req, error_body("forbidden"));
        auto& ops = svc->operators();
        return make_json_response(http::status::ok, req,
                                  "{\"superadmin\":" + json_emit_string_or_null(ops.superadmin().empty() ? std::nullopt : std::optional<std::string>(ops.superadmin())) +
                                  ",\"operators\":" + string_list(ops.list_operators()) + "}");
    }));

    auto change_route = [svc](bool add) {
        return [svc, add](const Request& req, const auth::Claims& c) {
            std::string user_id = required_string(req.body(), "user_id");
            auto& ops = svc->operators();
            acl::Change ch = add ? ops.add_operator(c.sub, user_id) : ops.remove_operator(c.sub, user_id);
            http::status st = http::status::ok;
            if (ch == acl::Change::Forbidden) st = http::status::forbidden;
            else if (ch == acl::Change::Invalid) st = http::status::bad_request;
            else if (ch == acl::Change::Protected) st = http::status::conflict;
            return make_json_response(st, req, "{\"result\":\"" + std::string(acl::to_string(ch)) +
                                                   "\",\"user_id\":\"" + json_escape_resp(user_id) + "\"}");
        };
    };
    router.add_route("POST", "/v1/admins", guarded(ctx, change_route(true)));
    router.add_route("POST", "/v1/admins/remove", guarded(ctx, change_route(false)));
}
