#include "Recovery.h"
#include "Scheduler.h"
#include "../audit/AuditLog.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace jobs {

RecoveryBootstrapper::RecoveryBootstrapper(std::shared_ptr<JobStore> store, std::shared_ptr<Scheduler> scheduler,
                                           std::shared_ptr<audit::AuditLog> audit,
                                           std::chrono::milliseconds overdue_delay)
    : store_(std::move(store)), scheduler_(std::move(scheduler)), audit_(std::move(audit)),
      overdue_delay_(overdue_delay) {}

RecoveryReport RecoveryBootstrapper::restore_on_startup() {
    RecoveryReport report;
    auto& metrics = observability::Metrics::instance();

    for (const auto& job : store_->list_in_progress()) {
        if (scheduler_->is_in_flight(job.id)) continue;
        if (!store_->mark_failed(job.id, "interrupted by restart")) continue;
        ++report.interrupted;
        observability::log_warn("recovery.interrupted", {{"job_id", job.id}, {"handle", job.target_handle}});
        metrics.count_event("recovery", "interrupted");
        std::optional<std::string> actor;
        if (job.created_by != system_actor()) actor = job.created_by;
        audit_->record(actor, "disable_account", job.target_handle,
                       {{"job_id", std::to_string(job.id)}, {"result", "failed"}, {"reason", "interrupted by restart"}});
    }

    ScheduledScan scan = store_->scan_scheduled();
    for (const auto& bad : scan.corrupt) {
        ++report.corrupt;
        observability::log_error("recovery.corrupt_job", {{"job_id", bad.id}, {"reason", bad.reason}});
        metrics.count_event("recovery", "corrupt");
    }

    auto now = timeutil::Clock::now();
    for (const auto& job : scan.jobs) {
        if (job.run_at <= now) {
            ++report.overdue;
            observability::log_info("recovery.overdue", {{"job_id", job.id}, {"handle", job.target_handle},
                                                         {"run_at", timeutil::format_iso_z(job.run_at)}});
            metrics.count_event("recovery", "overdue");
            scheduler_->arm(job.id, now + overdue_delay_);
        } else {
            ++report.rearmed;
            observability::log_info("recovery.rearmed", {{"job_id", job.id}, {"handle", job.target_handle},
                                                         {"run_at", timeutil::format_iso_z(job.run_at)}});
            metrics.count_event("recovery", "rearmed");
            scheduler_->arm(job.id, job.run_at);
        }
    }

    observability::log_info("recovery.done", {{"rearmed", int64_t(report.rearmed)},
                                              {"overdue", int64_t(report.overdue)},
                                              {"corrupt", int64_t(report.corrupt)},
                                              {"interrupted", int64_t(report.interrupted)}});
    return report;
}

}
