#include "Scheduler.h"
#include "../audit/AuditLog.h"
#include "../directory/Directory.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <chrono>
#include <exception>

namespace jobs {

namespace {

directory::ActionRequest request_for(const Job& job) {
    directory::ActionRequest req;
    switch (job.type) {
        case JobType::DisableAccount: req.type = directory::ActionType::DisableAccount; break;
    }
    req.target = job.target_handle;
    return req;
}

}

Scheduler::Scheduler(boost::asio::io_context& ioc, std::shared_ptr<JobStore> store,
                     std::shared_ptr<directory::ActionExecutor> executor,
                     std::shared_ptr<audit::AuditLog> audit)
    : Scheduler(ioc, std::move(store), std::move(executor), std::move(audit), Options{}) {}

Scheduler::Scheduler(boost::asio::io_context& ioc, std::shared_ptr<JobStore> store,
                     std::shared_ptr<directory::ActionExecutor> executor,
                     std::shared_ptr<audit::AuditLog> audit, Options opts)
    : ioc_(ioc), store_(std::move(store)), executor_(std::move(executor)), audit_(std::move(audit)),
      opts_(opts), pool_(opts.threads ? opts.threads : 1) {}

Scheduler::~Scheduler() { stop(); }

CreateResult Scheduler::submit(const NewJob& job) {
    CreateResult res = store_->create_job(job);
    observability::log_info("job.persisted", {{"job_id", res.id},
                                              {"handle", job.target_handle},
                                              {"run_at", timeutil::format_iso_z(job.run_at)},
                                              {"created", int64_t(res.created ? 1 : 0)}});
    arm(res.id, job.run_at);
    return res;
}

void Scheduler::arm(int64_t id, timeutil::TimePoint when) {
    if (stopped_) return;
    std::weak_ptr<Scheduler> weak = weak_from_this();
    std::lock_guard lock(mu_);
    Armed& slot = armed_[id];
    if (slot.timer) slot.timer->cancel();
    slot.generation = next_generation_++;
    slot.timer = std::make_unique<boost::asio::system_timer>(ioc_, when);
    uint64_t gen = slot.generation;
    slot.timer->async_wait([weak, id, gen](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->on_timer(id, gen);
    });
    observability::Metrics::instance().set_gauge("ops_jobs_armed", double(armed_.size()));
    observability::log_debug("job.armed", {{"job_id", id}, {"at", timeutil::format_iso_z(when)}});
}

void Scheduler::on_timer(int64_t id, uint64_t generation) {
    {
        std::lock_guard lock(mu_);
        auto it = armed_.find(id);
        if (it == armed_.end() || it->second.generation != generation) return;
        armed_.erase(it);
        observability::Metrics::instance().set_gauge("ops_jobs_armed", double(armed_.size()));
    }
    if (stopped_) return;
    auto self = shared_from_this();
    boost::asio::post(pool_, [self, id] { self->execute(id); });
}

void Scheduler::execute(int64_t id) {
    {
        std::lock_guard lock(mu_);
        if (!in_flight_.insert(id).second) {
            observability::log_warn("job.already_running", {{"job_id", id}});
            observability::Metrics::instance().count_event("job_execution", "skipped");
            return;
        }
    }
    struct InFlightRelease {
        Scheduler* s;
        int64_t id;
        ~InFlightRelease() { std::lock_guard lock(s->mu_); s->in_flight_.erase(id); }
    } release{this, id};

    std::optional<Job> job;
    try {
        job = store_->claim(id);
    } catch (const PersistenceError& e) {
        observability::log_error("job.claim_failed", {{"job_id", id}, {"err", std::string(e.what())}});
        arm(id, timeutil::Clock::now() + opts_.store_retry_delay);
        return;
    }
    if (!job) {
        observability::log_info("job.skip_not_scheduled", {{"job_id", id}});
        observability::Metrics::instance().count_event("job_execution", "skipped");
        return;
    }

    observability::log_info("job.start", {{"job_id", id}, {"type", std::string(to_string(job->type))},
                                          {"handle", job->target_handle}});
    directory::ActionRequest req = request_for(*job);
    directory::ActionResult result;
    auto started = std::chrono::steady_clock::now();
    try {
        result = executor_->perform(req);
    } catch (const std::exception& e) {
        result = directory::ActionResult::failure(std::string("executor error: ") + e.what());
    } catch (...) {
        result = directory::ActionResult::failure("executor error: unknown");
    }
    std::chrono::duration<double, std::milli> took = std::chrono::steady_clock::now() - started;
    observability::Metrics::instance().observe_action(directory::to_string(req.type), took.count());

    if (result.ok) finish(*job, JobStatus::Done, std::string());
    else finish(*job, JobStatus::Failed, result.reason.empty() ? std::string("failed") : result.reason);
}

void Scheduler::finish(const Job& job, JobStatus status, const std::string& reason) {
    bool changed = false;
    try {
        changed = status == JobStatus::Done ? store_->mark_done(job.id) : store_->mark_failed(job.id, reason);
    } catch (const PersistenceError& e) {
        // The row stays IN_PROGRESS; startup recovery closes it as failed.
        observability::log_error("job.finish_persist_failed", {{"job_id", job.id}, {"err", std::string(e.what())}});
    }
    if (!changed) observability::log_warn("job.finish_noop", {{"job_id", job.id}});

    const char* outcome = status == JobStatus::Done ? "done" : "failed";
    if (status == JobStatus::Done) {
        observability::log_info("job.done", {{"job_id", job.id}, {"handle", job.target_handle}});
    } else {
        observability::log_warn("job.failed", {{"job_id", job.id}, {"handle", job.target_handle}, {"reason", reason}});
    }
    observability::Metrics::instance().count_event("job_execution", outcome);

    std::map<std::string, std::string> details{{"job_id", std::to_string(job.id)},
                                               {"result", outcome},
                                               {"run_at", timeutil::format_iso_z(job.run_at)}};
    if (!reason.empty()) details["reason"] = reason;
    auto src = job.metadata.find("source");
    if (src != job.metadata.end()) details["source"] = src->second;
    std::optional<std::string> actor;
    if (job.created_by != system_actor()) actor = job.created_by;
    audit_->record(actor, directory::to_string(request_for(job).type), job.target_handle, details);

    FinishedHook hook;
    {
        std::lock_guard lock(mu_);
        hook = finished_hook_;
    }
    if (!hook) return;
    try {
        hook(job, status);
    } catch (const std::exception& e) {
        observability::log_error("job.finished_hook_failed", {{"job_id", job.id}, {"err", std::string(e.what())}});
    } catch (...) {
        observability::log_error("job.finished_hook_failed", {{"job_id", job.id}, {"err", std::string("unknown")}});
    }
}

bool Scheduler::is_armed(int64_t id) const {
    std::lock_guard lock(mu_);
    return armed_.count(id) > 0;
}

std::size_t Scheduler::armed_count() const {
    std::lock_guard lock(mu_);
    return armed_.size();
}

std::size_t Scheduler::in_flight_count() const {
    std::lock_guard lock(mu_);
    return in_flight_.size();
}

bool Scheduler::is_in_flight(int64_t id) const {
    std::lock_guard lock(mu_);
    return in_flight_.count(id) > 0;
}

void Scheduler::set_finished_hook(FinishedHook hook) {
    std::lock_guard lock(mu_);
    finished_hook_ = std::move(hook);
}

void Scheduler::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) return;
    {
        std::lock_guard lock(mu_);
        for (auto& kv : armed_) if (kv.second.timer) kv.second.timer->cancel();
        armed_.clear();
    }
    observability::Metrics::instance().set_gauge("ops_jobs_armed", 0);
    pool_.join();
    observability::log_info("scheduler.stopped");
}

}
