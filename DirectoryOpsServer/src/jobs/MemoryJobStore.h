#pragma once

#include "Job.h"

#include <map>
#include <mutex>

namespace jobs {

// Process-local JobStore. snapshot() and the seeding constructor stand in for a restart.
class MemoryJobStore : public JobStore {
public:
    MemoryJobStore() = default;
    explicit MemoryJobStore(const std::vector<Job>& rows);

    CreateResult create_job(const NewJob& job) override;
    std::optional<Job> get(int64_t id) override;
    std::optional<Job> claim(int64_t id) override;
    bool mark_done(int64_t id) override;
    bool mark_failed(int64_t id, const std::string& reason) override;
    ScheduledScan scan_scheduled() override;
    std::vector<Job> list_in_progress() override;
    std::vector<Job> list_recent(std::size_t limit) override;

    std::vector<Job> snapshot() const;

private:
    bool finish(int64_t id, JobStatus to, const std::string& reason);

    mutable std::mutex mu_;
    std::map<int64_t, Job> jobs_;
    int64_t next_id_ = 1;
};

}
