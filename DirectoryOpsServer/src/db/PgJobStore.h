#pragma once

#include "../jobs/Job.h"

#include <memory>
#include <variant>

namespace db {

class DbPool;
struct DbResult;

class PgJobStore : public jobs::JobStore {
public:
    explicit PgJobStore(std::shared_ptr<DbPool> pool);

    jobs::CreateResult create_job(const jobs::NewJob& job) override;
    std::optional<jobs::Job> get(int64_t id) override;
    std::optional<jobs::Job> claim(int64_t id) override;
    bool mark_done(int64_t id) override;
    bool mark_failed(int64_t id, const std::string& reason) override;
    jobs::ScheduledScan scan_scheduled() override;
    std::vector<jobs::Job> list_in_progress() override;
    std::vector<jobs::Job> list_recent(std::size_t limit) override;

private:
    std::vector<jobs::Job> decode_all(const DbResult& r, const char* what);
    std::optional<jobs::Job> decode_one(const DbResult& r);

    std::shared_ptr<DbPool> pool_;
};

// Row layout of job_columns(). Unreadable rows come back as CorruptJob.
std::variant<jobs::Job, jobs::CorruptJob> decode_job_row(const std::vector<std::optional<std::string>>& row);
std::string job_columns();

}
