#pragma once

#include "Job.h"

#include <chrono>
#include <cstddef>
#include <memory>

namespace audit { class AuditLog; }

namespace jobs {

class Scheduler;

struct RecoveryReport {
    std::size_t rearmed = 0;      // future jobs armed for their own run_at
    std::size_t overdue = 0;      // past jobs armed after the startup delay
    std::size_t corrupt = 0;
    std::size_t interrupted = 0;  // IN_PROGRESS at startup, closed as failed
};

// Reconciles the durable store with the scheduler's timers at startup. Safe to run again:
// arming an id replaces its previous timer.
class RecoveryBootstrapper {
public:
    RecoveryBootstrapper(std::shared_ptr<JobStore> store, std::shared_ptr<Scheduler> scheduler,
                         std::shared_ptr<audit::AuditLog> audit,
                         std::chrono::milliseconds overdue_delay = std::chrono::milliseconds(5000));

    // Throws PersistenceError if the store cannot be read at all.
    RecoveryReport restore_on_startup();

private:
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<audit::AuditLog> audit_;
    std::chrono::milliseconds overdue_delay_;
};

}
