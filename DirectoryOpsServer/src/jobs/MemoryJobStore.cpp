#include "MemoryJobStore.h"

#include <algorithm>

namespace jobs {

MemoryJobStore::MemoryJobStore(const std::vector<Job>& rows) {
    for (const auto& j : rows) {
        jobs_[j.id] = j;
        next_id_ = std::max(next_id_, j.id + 1);
    }
}

CreateResult MemoryJobStore::create_job(const NewJob& job) {
    auto now = timeutil::Clock::now();
    std::lock_guard lock(mu_);
    for (auto& kv : jobs_) {
        Job& j = kv.second;
        if (is_live(j.status) && j.type == job.type && j.target_handle == job.target_handle && j.run_at == job.run_at) {
            j.created_by = job.created_by;
            j.metadata = job.metadata;
            j.updated_at = now;
            return CreateResult{j.id, false};
        }
    }
    Job j;
    j.id = next_id_++;
    j.type = job.type;
    j.target_handle = job.target_handle;
    j.run_at = job.run_at;
    j.created_by = job.created_by;
    j.metadata = job.metadata;
    j.created_at = now;
    j.updated_at = now;
    jobs_[j.id] = j;
    return CreateResult{j.id, true};
}

std::optional<Job> MemoryJobStore::get(int64_t id) {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::optional<Job> MemoryJobStore::claim(int64_t id) {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.status != JobStatus::Scheduled) return std::nullopt;
    it->second.status = JobStatus::InProgress;
    it->second.updated_at = timeutil::Clock::now();
    return it->second;
}

bool MemoryJobStore::finish(int64_t id, JobStatus to, const std::string& reason) {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || is_terminal(it->second.status)) return false;
    it->second.status = to;
    it->second.last_error = reason;
    it->second.updated_at = timeutil::Clock::now();
    return true;
}

bool MemoryJobStore::mark_done(int64_t id) {
    return finish(id, JobStatus::Done, std::string());
}

bool MemoryJobStore::mark_failed(int64_t id, const std::string& reason) {
    return finish(id, JobStatus::Failed, reason);
}

ScheduledScan MemoryJobStore::scan_scheduled() {
    ScheduledScan scan;
    {
        std::lock_guard lock(mu_);
        for (const auto& kv : jobs_) if (kv.second.status == JobStatus::Scheduled) scan.jobs.push_back(kv.second);
    }
    std::stable_sort(scan.jobs.begin(), scan.jobs.end(), [](const Job& a, const Job& b) { return a.run_at < b.run_at; });
    return scan;
}

std::vector<Job> MemoryJobStore::list_in_progress() {
    std::lock_guard lock(mu_);
    std::vector<Job> out;
    for (const auto& kv : jobs_) if (kv.second.status == JobStatus::InProgress) out.push_back(kv.second);
    return out;
}

std::vector<Job> MemoryJobStore::list_recent(std::size_t limit) {
    std::lock_guard lock(mu_);
    std::vector<Job> out;
    for (auto it = jobs_.rbegin(); it != jobs_.rend() && out.size() < limit; ++it) out.push_back(it->second);
    return out;
}

std::vector<Job> MemoryJobStore::snapshot() const {
    std::lock_guard lock(mu_);
    std::vector<Job> out;
    for (const auto& kv : jobs_) out.push_back(kv.second);
    return out;
}

}
