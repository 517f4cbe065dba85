#include "Job.h"

namespace jobs {

const char* to_string(JobType t) {
    switch (t) {
        case JobType::DisableAccount: return "DISABLE_ACCOUNT";
    }
    return "UNKNOWN";
}

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Scheduled: return "SCHEDULED";
        case JobStatus::InProgress: return "IN_PROGRESS";
        case JobStatus::Done: return "DONE";
        case JobStatus::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<JobType> parse_job_type(const std::string& s) {
    if (s == "DISABLE_ACCOUNT") return JobType::DisableAccount;
    return std::nullopt;
}

std::optional<JobStatus> parse_job_status(const std::string& s) {
    if (s == "SCHEDULED") return JobStatus::Scheduled;
    if (s == "IN_PROGRESS") return JobStatus::InProgress;
    if (s == "DONE") return JobStatus::Done;
    if (s == "FAILED") return JobStatus::Failed;
    return std::nullopt;
}

}
