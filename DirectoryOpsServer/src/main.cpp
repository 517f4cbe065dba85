#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <functional>
#include <memory>
#include <cstdlib>
#include <thread>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/ApiRoutes.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "db/Storage.h"
#include "db/PgJobStore.h"
#include "db/PgAuditStore.h"
#include "db/PgAdminStore.h"
#include "acl/Operators.h"
#include "audit/AuditLog.h"
#include "directory/NoopDirectory.h"
#include "directory/PowerShellDirectory.h"
#include "directory/ScriptRunner.h"
#include "identity/Resolver.h"
#include "intake/IntentClassifier.h"
#include "intake/MailExtractor.h"
#include "jobs/MemoryJobStore.h"
#include "jobs/Recovery.h"
#include "jobs/Scheduler.h"
#include "service/OpsService.h"
#include "session/Sessions.h"
#include "timeutil/Time.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

namespace {

struct DirectoryBackend {
    std::shared_ptr<directory::IdentitySearch> search;
    std::shared_ptr<directory::ActionExecutor> executor;
};

DirectoryBackend make_directory(const Config& cfg) {
    if (cfg.directory_backend == Config::DirectoryBackend::POWERSHELL) {
        auto ps = std::make_shared<directory::PowerShellDirectory>(directory::split_command(cfg.directory_command),
                                                                   std::chrono::seconds(cfg.directory_timeout_sec),
                                                                   cfg.directory_search_base);
        log_info("directory_backend", {{"backend", "powershell"}});
        return {ps, ps};
    }
    auto roster = cfg.directory_roster.empty() ? directory::NoopDirectory::demo_roster()
                                               : directory::NoopDirectory::load_roster(cfg.directory_roster);
    auto noop = std::make_shared<directory::NoopDirectory>(std::move(roster));
    log_warn("directory_backend", {{"backend", "noop"}});
    return {noop, noop};
}

}

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(config::log_level_number(cfg.log_level));
    timeutil::set_timezone(cfg.timezone);

    if (cfg.jwt_secret.empty()) {
        std::cerr << "fatal: JWT_SECRET environment variable is not set\n";
        return 2;
    }
    if (cfg.superadmin_id.empty()) log_warn("superadmin_not_configured", {});

    try {
        boost::asio::io_context io;

        std::shared_ptr<db::DbPool> dbpool;
        std::shared_ptr<jobs::JobStore> store;
        std::shared_ptr<audit::AuditLog> audit_log;
        std::shared_ptr<acl::AdminStore> admins;
        if (!cfg.database_url.empty()) {
            dbpool = std::make_shared<db::DbPool>(cfg.database_url, cfg.db_workers);
            db::ensure_schema(*dbpool);
            store = std::make_shared<db::PgJobStore>(dbpool);
            audit_log = std::make_shared<db::PgAuditStore>(dbpool);
            admins = std::make_shared<db::PgAdminStore>(dbpool);
        } else {
            log_warn("db_not_configured", {{"jobs", "memory"}});
            store = std::make_shared<jobs::MemoryJobStore>();
            audit_log = std::make_shared<audit::MemoryAuditLog>();
            admins = std::make_shared<acl::MemoryAdminStore>();
        }

        auto backend = make_directory(cfg);
        auto today = [] { return timeutil::local_date_of(timeutil::Clock::now()); };

        jobs::Scheduler::Options sopts;
        sopts.threads = static_cast<std::size_t>(cfg.executor_threads);
        auto scheduler = std::make_shared<jobs::Scheduler>(io, store, backend.executor, audit_log, sopts);

        service::Dependencies deps;
        deps.resolver = std::make_shared<identity::IdentityResolver>(backend.search, static_cast<std::size_t>(cfg.raw_search_limit));
        deps.sessions = std::make_shared<session::SessionManager>(std::chrono::seconds(cfg.session_ttl_sec));
        deps.scheduler = scheduler;
        deps.store = store;
        deps.executor = backend.executor;
        deps.audit = audit_log;
        deps.operators = std::make_shared<acl::Operators>(cfg.superadmin_id, admins, audit_log);
        deps.classifier = std::make_shared<intake::RuleIntentClassifier>(today);

        service::Settings settings;
        settings.disable_hour = cfg.disable_hour;
        settings.resolver_limit = static_cast<std::size_t>(cfg.resolver_limit);
        settings.password_length = static_cast<std::size_t>(cfg.password_length);
        auto ops = std::make_shared<service::OpsService>(deps, settings);

        jobs::RecoveryBootstrapper recovery(store, scheduler, audit_log, std::chrono::milliseconds(cfg.recovery_delay_ms));
        auto report = recovery.restore_on_startup();
        log_info("recovery_report", {{"rearmed", int64_t(report.rearmed)}, {"overdue", int64_t(report.overdue)},
                                     {"corrupt", int64_t(report.corrupt)}, {"interrupted", int64_t(report.interrupted)}});

        Router router;
        ApiContext api;
        api.service = ops;
        api.mail = std::make_shared<intake::MailExtractor>(today);
        api.jwt_secret = cfg.jwt_secret;
        api.mail_principal = cfg.mail_principal;
        api.metrics_enabled = cfg.metrics_enabled;
        register_api_routes(router, api);
        log_info("routes_registered", {{"count", int64_t(router.paths().size())}});

        auto cpu_pool = std::make_shared<boost::asio::thread_pool>(static_cast<std::size_t>(cfg.http_threads));

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log, cpu_pool);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            server.stop();
            scheduler->stop();
            io.stop();
        });

        log_info("server_start", {{"port", int64_t(server.port())}});
        server.run();
        io.run();

        scheduler->stop();
        cpu_pool->join();
    } catch (const jobs::PersistenceError& e) {
        log_error("startup_persistence_failure", {{"err", std::string(e.what())}});
        std::cerr << "persistence error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
