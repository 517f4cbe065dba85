
#include <iostream>
#include <memory>
#include <string>
#include <boost/beast/http.hpp>
#include "acl/Operators.h"
#include "audit/AuditLog.h"
#include "auth/Jwt.h"
#include "directory/NoopDirectory.h"
#include "identity/Resolver.h"
#include "intake/IntentClassifier.h"
#include "intake/MailExtractor.h"
#include "jobs/MemoryJobStore.h"
#include "jobs/Scheduler.h"
#include "net/ApiRoutes.h"
#include "net/Router.h"
#include "service/OpsService.h"
#include "session/Sessions.h"
#include "test_util.h"

namespace http = boost::beast::http;
using timeutil::LocalDate;

namespace {

const std::string kSecret = "route-secret";

class FlakyStore : public jobs::MemoryJobStore {
public:
    bool down = false;
    jobs::CreateResult create_job(const jobs::NewJob& j) override {
        if (down) throw jobs::PersistenceError("database is down");
        return MemoryJobStore::create_job(j);
    }
};

struct Api {
    IoRunner io;
    std::shared_ptr<directory::NoopDirectory> dir = std::make_shared<directory::NoopDirectory>();
    std::shared_ptr<FlakyStore> store = std::make_shared<FlakyStore>();
    std::shared_ptr<audit::MemoryAuditLog> audit = std::make_shared<audit::MemoryAuditLog>();
    std::shared_ptr<jobs::Scheduler> scheduler;
    Router router;

    Api() {
        scheduler = std::make_shared<jobs::Scheduler>(io.ioc, store, dir, audit);
        auto admins = std::make_shared<acl::MemoryAdminStore>();
        admins->add("200", "100");
        auto today = [] { return LocalDate{2029, 12, 1}; };

        service::Dependencies deps;
        deps.resolver = std::make_shared<identity::IdentityResolver>(dir);
        deps.sessions = std::make_shared<session::SessionManager>();
        deps.scheduler = scheduler;
        deps.store = store;
        deps.executor = dir;
        deps.audit = audit;
        deps.operators = std::make_shared<acl::Operators>("100", admins, audit);
        deps.classifier = std::make_shared<intake::RuleIntentClassifier>(today);

        ApiContext ctx;
        ctx.service = std::make_shared<service::OpsService>(deps, service::Settings{});
        ctx.mail = std::make_shared<intake::MailExtractor>(today);
        ctx.jwt_secret = kSecret;
        ctx.mail_principal = "mail-ingest";
        register_api_routes(router, ctx);
    }
    ~Api() { scheduler->stop(); }

    Response call(http::verb m, const std::string& target, const std::string& principal, const std::string& body = "") {
        Request req{m, target, 11};
        req.set(http::field::host, "localhost");
        if (!principal.empty()) {
            auth::Claims c;
            c.sub = principal;
            c.name = "Test " + principal;
            c.iat = timeutil::Clock::to_time_t(timeutil::Clock::now());
            c.exp = c.iat + 3600;
            req.set(http::field::authorization, "Bearer " + auth::create_jwt(c, kSecret));
        }
        req.body() = body;
        req.prepare_payload();
        return router.route(req);
    }
};

int expect(const Response& res, http::status st, const std::string& needle, const char* what) {
    if (res.result() != st) { std::cerr << what << ": status " << res.result_int() << " body " << res.body() << "\n"; return 1; }
    if (!needle.empty() && res.body().find(needle) == std::string::npos) { std::cerr << what << ": body lacks " << needle << ": " << res.body() << "\n"; return 1; }
    return 0;
}

}

int main() {
    timeutil::set_timezone("Europe/Moscow");
    Api api;
    int bad = 0;

    bad += expect(api.call(http::verb::get, "/health", ""), http::status::ok, "\"ok\"", "health");
    bad += expect(api.call(http::verb::get, "/metrics", ""), http::status::ok, "http_requests_total", "metrics");
    bad += expect(api.call(http::verb::get, "/v1/jobs", ""), http::status::unauthorized, "unauthorized", "no token");
    {
        Request req{http::verb::get, "/v1/jobs", 11};
        req.set(http::field::authorization, "Bearer not.a.jwt");
        bad += expect(api.router.route(req), http::status::unauthorized, "", "garbage token");
    }

    bad += expect(api.call(http::verb::post, "/v1/requests/text", "999", "{\"text\":\"block alice 2030-01-10\"}"),
                  http::status::forbidden, "\"outcome\":\"denied\"", "stranger text");
    bad += expect(api.call(http::verb::post, "/v1/requests/text", "200", "{\"text\":"), http::status::bad_request, "bad_request", "broken json");
    bad += expect(api.call(http::verb::post, "/v1/requests/text", "200", "{}"), http::status::bad_request, "missing field text", "missing text");

    {
        auto res = api.call(http::verb::post, "/v1/requests/text", "200", "{\"text\":\"block alice 2030-01-10\"}");
        bad += expect(res, http::status::ok, "\"outcome\":\"scheduled\"", "schedule alice");
        bad += expect(res, http::status::ok, "\"run_at\":\"2030-01-10T13:00:00Z\"", "run_at in UTC");
        bad += expect(res, http::status::ok, "\"created\":true", "first job created");
    }

    {
        auto res = api.call(http::verb::post, "/v1/requests/text", "200", "{\"text\":\"block Иванова 2030-01-10\"}");
        bad += expect(res, http::status::ok, "\"outcome\":\"choose\"", "ambiguous target");
        const std::string& body = res.body();
        auto first = body.find("\"data\":\"sel:");
        if (first == std::string::npos || body.find("\"data\":\"sel:", first + 1) == std::string::npos) {
            std::cerr << "expected two choices in " << body << "\n"; return 1;
        }
        std::string data = body.substr(first + 8, body.find('"', first + 8) - (first + 8));
        auto picked = api.call(http::verb::post, "/v1/callbacks", "200", "{\"data\":\"" + data + "\"}");
        bad += expect(picked, http::status::ok, "\"outcome\":\"scheduled\"", "callback pick");
        bad += expect(api.call(http::verb::post, "/v1/callbacks", "200", "{\"data\":\"" + data + "\"}"),
                      http::status::ok, "selection_expired", "callback reuse");
    }

    {
        auto res = api.call(http::verb::get, "/v1/jobs", "200");
        bad += expect(res, http::status::ok, "\"outcome\":\"jobs\"", "list jobs");
        bad += expect(res, http::status::ok, "\"target\":\"alice\"", "alice listed");
        bad += expect(res, http::status::ok, "\"status\":\"SCHEDULED\"", "status listed");
    }

    bad += expect(api.call(http::verb::get, "/v1/whoami", "100"), http::status::ok, "\"superadmin\":true", "whoami");

    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "mail-ingest",
                           "{\"text\":\"Employee terminated effective 2030-01-10, sam=alice\"}"),
                  http::status::ok, "\"created\":false", "mail text collapses onto existing job");
    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "mail-ingest", "{\"handle\":\"ppetrov\",\"date\":\"10.01.2030\"}"),
                  http::status::ok, "\"outcome\":\"scheduled\"", "structured mail");
    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "mail-ingest", "{\"handle\":\"ppetrov\"}"),
                  http::status::bad_request, "missing field date", "mail without date");
    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "mail-ingest", "{\"handle\":\"ppetrov\",\"date\":\"30.02.2030\"}"),
                  http::status::bad_request, "invalid date", "mail with bad date");
    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "mail-ingest", "{\"text\":\"lunch on friday\"}"),
                  http::status::ok, "\"outcome\":\"unrecognized\"", "not a notice");
    bad += expect(api.call(http::verb::post, "/v1/requests/mail", "999", "{\"handle\":\"ppetrov\",\"date\":\"10.01.2030\"}"),
                  http::status::forbidden, "forbidden", "stranger mail");

    bad += expect(api.call(http::verb::post, "/v1/admins", "200", "{\"user_id\":\"300\"}"), http::status::forbidden, "forbidden", "operator cannot grant");
    bad += expect(api.call(http::verb::post, "/v1/admins", "100", "{\"user_id\":\"300\"}"), http::status::ok, "\"added\"", "grant");
    bad += expect(api.call(http::verb::get, "/v1/admins", "300"), http::status::ok, "\"300\"", "list operators");
    bad += expect(api.call(http::verb::post, "/v1/admins/remove", "100", "{\"user_id\":\"100\"}"), http::status::conflict, "protected", "superadmin protected");
    bad += expect(api.call(http::verb::post, "/v1/admins/remove", "100", "{\"user_id\":\"300\"}"), http::status::ok, "removed", "revoke");
    bad += expect(api.call(http::verb::get, "/v1/admins", "300"), http::status::forbidden, "forbidden", "revoked operator");

    api.store->down = true;
    bad += expect(api.call(http::verb::post, "/v1/requests/text", "200", "{\"text\":\"block ppetrov 2030-02-01\"}"),
                  http::status::service_unavailable, "persistence_failure", "store down");
    api.store->down = false;

    if (bad) return 1;
    std::cout << "api_routes_unit ok\n";
    return 0;
}
