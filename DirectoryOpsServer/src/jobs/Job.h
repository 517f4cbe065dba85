#pragma once

#include "../timeutil/Time.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jobs {

enum class JobType { DisableAccount };

// IN_PROGRESS is held only while the external call is outstanding.
enum class JobStatus { Scheduled, InProgress, Done, Failed };

const char* to_string(JobType t);
const char* to_string(JobStatus s);
std::optional<JobType> parse_job_type(const std::string& s);
std::optional<JobStatus> parse_job_status(const std::string& s);

inline bool is_terminal(JobStatus s) { return s == JobStatus::Done || s == JobStatus::Failed; }
inline bool is_live(JobStatus s) { return !is_terminal(s); }

// created_by for jobs that no operator asked for.
inline const char* system_actor() { return "system"; }

struct Job {
    int64_t id = 0;
    JobType type = JobType::DisableAccount;
    std::string target_handle;
    timeutil::TimePoint run_at;
    JobStatus status = JobStatus::Scheduled;
    std::string created_by;
    std::map<std::string, std::string> metadata;
    std::string last_error;
    timeutil::TimePoint created_at;
    timeutil::TimePoint updated_at;
};

struct NewJob {
    JobType type = JobType::DisableAccount;
    std::string target_handle;
    timeutil::TimePoint run_at;
    std::string created_by;
    std::map<std::string, std::string> metadata;
};

struct CreateResult {
    int64_t id = 0;
    bool created = false;   // false when collapsed onto an existing live job
};

// A SCHEDULED row that could not be decoded.
struct CorruptJob {
    std::string id;
    std::string reason;
};

struct ScheduledScan {
    std::vector<Job> jobs;            // ascending run_at
    std::vector<CorruptJob> corrupt;
};

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable job storage. Every method throws PersistenceError when the store is unreachable.
class JobStore {
public:
    virtual ~JobStore() = default;

    // Idempotent on (type, target_handle, run_at) among live jobs: a repeat replaces
    // created_by and metadata of the existing row.
    virtual CreateResult create_job(const NewJob& job) = 0;
    virtual std::optional<Job> get(int64_t id) = 0;

    // SCHEDULED -> IN_PROGRESS. nullopt if the job is missing or no longer SCHEDULED.
    virtual std::optional<Job> claim(int64_t id) = 0;

    // Both accept SCHEDULED or IN_PROGRESS and return false without change otherwise.
    virtual bool mark_done(int64_t id) = 0;
    virtual bool mark_failed(int64_t id, const std::string& reason) = 0;

    virtual ScheduledScan scan_scheduled() = 0;
    virtual std::vector<Job> list_in_progress() = 0;
    virtual std::vector<Job> list_recent(std::size_t limit) = 0;

    std::vector<Job> list_scheduled() { return scan_scheduled().jobs; }
};

}
