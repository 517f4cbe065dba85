#include "OpsService.h"
#include "../acl/Operators.h"
#include "../audit/AuditLog.h"
#include "../auth/Password.h"
#include "../identity/Resolver.h"
#include "../intake/Callback.h"
#include "../jobs/Scheduler.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../text/Utf8.h"

#include <chrono>
#include <exception>
#include <stdexcept>

namespace service {

namespace {

Outcome simple(Outcome::Kind kind, std::string message) {
    Outcome o;
    o.kind = kind;
    o.message = std::move(message);
    return o;
}

}

const char* to_string(Outcome::Kind k) {
    switch (k) {
        case Outcome::Kind::Denied: return "denied";
        case Outcome::Kind::Unrecognized: return "unrecognized";
        case Outcome::Kind::NeedTarget: return "need_target";
        case Outcome::Kind::NotFound: return "not_found";
        case Outcome::Kind::Choose: return "choose";
        case Outcome::Kind::SelectionExpired: return "selection_expired";
        case Outcome::Kind::Cancelled: return "cancelled";
        case Outcome::Kind::PasswordReset: return "password_reset";
        case Outcome::Kind::Scheduled: return "scheduled";
        case Outcome::Kind::Failed: return "failed";
        case Outcome::Kind::Jobs: return "jobs";
    }
    return "unknown";
}

OpsService::OpsService(Dependencies deps, Settings settings)
    : deps_(std::move(deps)), settings_(settings) {
    if (!deps_.resolver || !deps_.sessions || !deps_.scheduler || !deps_.store || !deps_.executor ||
        !deps_.audit || !deps_.operators || !deps_.classifier) {
        throw std::invalid_argument("OpsService: missing dependency");
    }
}

timeutil::TimePoint OpsService::disable_time(const std::optional<timeutil::LocalDate>& date) const {
    timeutil::LocalDate day = date ? *date : timeutil::local_date_of(timeutil::Clock::now());
    auto tp = timeutil::local_time_at(day, settings_.disable_hour);
    if (!tp) throw std::invalid_argument("invalid date " + timeutil::format_date(day));
    return *tp;
}

Outcome OpsService::handle_text(const std::string& principal, const std::string& text) {
    if (!deps_.operators->is_operator(principal)) {
        observability::log_warn("ops.denied", {{"principal", principal}});
        return simple(Outcome::Kind::Denied, "Access denied");
    }
    intake::Classification c = deps_.classifier->classify(text);
    observability::log_debug("ops.classified", {{"intent", std::string(intake::to_string(c.intent))}, {"query", c.query}});
    if (c.intent == intake::Intent::None) return simple(Outcome::Kind::Unrecognized, "Could not understand the request");
    if (c.intent == intake::Intent::ListJobs) return list_jobs(principal);
    if (c.query.empty()) return simple(Outcome::Kind::NeedTarget, "Whose account?");

    session::PendingAction pending;
    pending.kind = c.intent == intake::Intent::Reset ? session::ActionKind::Reset : session::ActionKind::Disable;
    pending.target_query = c.query;
    pending.requested_by = principal;
    pending.source = "chat";
    if (pending.kind == session::ActionKind::Disable) pending.scheduled_for = disable_time(c.date);

    auto candidates = deps_.resolver->resolve(c.query, settings_.resolver_limit);
    if (candidates.empty()) return simple(Outcome::Kind::NotFound, "No account matches \"" + c.query + "\"");
    if (candidates.size() == 1) return dispatch(pending, candidates.front(), principal);
    return offer_choices(std::move(pending), std::move(candidates));
}

Outcome OpsService::handle_mail(const intake::MailEvent& event) {
    std::string query = !event.handle.empty() ? event.handle : event.name;
    if (query.empty()) return simple(Outcome::Kind::NeedTarget, "Mail names nobody");

    session::PendingAction pending;
    pending.kind = session::ActionKind::Disable;
    pending.target_query = query;
    pending.requested_by = deps_.operators->superadmin().empty() ? std::string(jobs::system_actor())
                                                                  : deps_.operators->superadmin();
    pending.scheduled_for = disable_time(event.date);
    pending.source = "mail";

    auto candidates = deps_.resolver->resolve(query, settings_.resolver_limit);
    if (!event.handle.empty()) {
        std::string want = text::fold_utf8(event.handle);
        for (const auto& c : candidates) {
            if (text::fold_utf8(c.handle) == want) {
                candidates = {c};
                break;
            }
        }
    }
    observability::log_info("ops.mail", {{"query", query}, {"candidates", int64_t(candidates.size())},
                                         {"date", timeutil::format_date(event.date)}});
    if (candidates.empty()) {
        deps_.audit->record(std::nullopt, "mail_unresolved", std::nullopt,
                            {{"query", query}, {"date", timeutil::format_date(event.date)}});
        return simple(Outcome::Kind::NotFound, "No account matches \"" + query + "\"");
    }
    if (candidates.size() == 1) {
        return schedule_disable(jobs::system_actor(), candidates.front(), *pending.scheduled_for, "mail", std::string());
    }
    return offer_choices(std::move(pending), std::move(candidates));
}

Outcome OpsService::handle_callback(const std::string& principal, const std::string& data) {
    if (!deps_.operators->is_operator(principal)) {
        observability::log_warn("ops.denied", {{"principal", principal}});
        return simple(Outcome::Kind::Denied, "Access denied");
    }
    auto payload = intake::parse_callback(data);
    if (!payload) return simple(Outcome::Kind::Unrecognized, "Unknown selection");

    if (auto cancel = std::get_if<intake::CancelSelection>(&*payload)) {
        if (!deps_.sessions->cancel(cancel->token)) return simple(Outcome::Kind::SelectionExpired, "Selection expired, please retry");
        return simple(Outcome::Kind::Cancelled, "Cancelled");
    }

    const auto& sel = std::get<intake::SelectCandidate>(*payload);
    // The token is consumed before the ownership check; a foreign attempt burns it.
    auto resolved = deps_.sessions->resolve(sel.token, sel.handle);
    if (!resolved) return simple(Outcome::Kind::SelectionExpired, "Selection expired, please retry");

    const auto& owner = resolved->pending.requested_by;
    if (owner != principal && owner != jobs::system_actor() && !deps_.operators->is_superadmin(principal)) {
        observability::log_warn("ops.foreign_selection", {{"principal", principal}, {"owner", owner}});
        return simple(Outcome::Kind::Denied, "This selection belongs to another operator");
    }
    return dispatch(resolved->pending, resolved->identity, principal);
}

Outcome OpsService::list_jobs(const std::string& principal) {
    if (!deps_.operators->is_operator(principal)) return simple(Outcome::Kind::Denied, "Access denied");
    Outcome o = simple(Outcome::Kind::Jobs, std::string());
    o.jobs = deps_.store->list_scheduled();
    o.message = o.jobs.empty() ? "No scheduled jobs" : std::to_string(o.jobs.size()) + " scheduled job(s)";
    return o;
}

WhoAmI OpsService::whoami(const std::string& principal) const {
    WhoAmI w;
    w.principal = principal;
    w.is_superadmin = deps_.operators->is_superadmin(principal);
    w.is_operator = deps_.operators->is_operator(principal);
    return w;
}

Outcome OpsService::dispatch(const session::PendingAction& pending, const directory::Identity& target, const std::string& actor) {
    if (pending.kind == session::ActionKind::Reset) return reset_password(actor, target);
    timeutil::TimePoint when = pending.scheduled_for ? *pending.scheduled_for : disable_time(std::nullopt);
    if (pending.source == "mail") return schedule_disable(jobs::system_actor(), target, when, pending.source, actor);
    return schedule_disable(actor, target, when, pending.source, std::string());
}

Outcome OpsService::offer_choices(session::PendingAction pending, std::vector<directory::Identity> candidates) {
    Outcome o;
    o.kind = Outcome::Kind::Choose;
    o.message = "Several accounts match \"" + pending.target_query + "\", pick one";
    for (const auto& c : candidates) o.choices.push_back(Choice{c.label(), std::string()});
    std::string token = deps_.sessions->open(std::move(pending), candidates);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        o.choices[i].data = intake::format_callback(intake::SelectCandidate{token, candidates[i].handle});
    }
    o.cancel_data = intake::format_callback(intake::CancelSelection{token});
    return o;
}

Outcome OpsService::reset_password(const std::string& actor, const directory::Identity& target) {
    directory::ActionRequest req;
    req.type = directory::ActionType::ResetPassword;
    req.target = target.handle;
    req.new_password = auth::generate_password(settings_.password_length);
    req.must_change_password = true;

    directory::ActionResult res;
    auto started = std::chrono::steady_clock::now();
    try {
        res = deps_.executor->perform(req);
    } catch (const std::exception& e) {
        res = directory::ActionResult::failure(std::string("executor error: ") + e.what());
    } catch (...) {
        res = directory::ActionResult::failure("executor error: unknown");
    }
    std::chrono::duration<double, std::milli> took = std::chrono::steady_clock::now() - started;
    observability::Metrics::instance().observe_action(directory::to_string(req.type), took.count());

    std::map<std::string, std::string> details{{"result", res.ok ? "done" : "failed"}};
    if (!res.ok) details["reason"] = res.reason;
    deps_.audit->record(actor, "reset_password", target.handle, details);
    observability::Metrics::instance().count_event("password_reset", res.ok ? "done" : "failed");

    Outcome o;
    o.identity = target;
    if (!res.ok) {
        observability::log_warn("ops.reset_failed", {{"handle", target.handle}, {"reason", res.reason}});
        o.kind = Outcome::Kind::Failed;
        o.message = "Password reset for " + target.label() + " failed: " + res.reason;
        return o;
    }
    o.kind = Outcome::Kind::PasswordReset;
    o.password = req.new_password;
    o.message = "New password for " + target.label() + " set, change required at next logon";
    return o;
}

Outcome OpsService::schedule_disable(const std::string& created_by, const directory::Identity& target,
                                     timeutil::TimePoint when, const std::string& source, const std::string& confirmed_by) {
    jobs::NewJob job;
    job.type = jobs::JobType::DisableAccount;
    job.target_handle = target.handle;
    job.run_at = when;
    job.created_by = created_by;
    job.metadata["source"] = source;
    job.metadata["display_name"] = target.display_name;
    if (!confirmed_by.empty()) job.metadata["confirmed_by"] = confirmed_by;

    jobs::CreateResult res = deps_.scheduler->submit(job);

    std::optional<std::string> actor;
    if (created_by != jobs::system_actor()) actor = created_by;
    else if (!confirmed_by.empty()) actor = confirmed_by;
    deps_.audit->record(actor, "schedule_disable", target.handle,
                        {{"job_id", std::to_string(res.id)},
                         {"run_at", timeutil::format_iso_z(when)},
                         {"source", source},
                         {"created", res.created ? "true" : "false"}});

    Outcome o;
    o.kind = Outcome::Kind::Scheduled;
    o.identity = target;
    o.job_id = res.id;
    o.job_created = res.created;
    o.run_at = when;
    o.message = "Account " + target.label() + " will be disabled at " + timeutil::format_local(when);
    return o;
}

}
