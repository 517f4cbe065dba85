#include "PgJobStore.h"
#include "DbPool.h"
#include "Storage.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

#include <stdexcept>

namespace db {

namespace {

const std::optional<std::string>& cell(const std::vector<std::optional<std::string>>& row, std::size_t i) {
    static const std::optional<std::string> none;
    return i < row.size() ? row[i] : none;
}

}

std::string job_columns() {
    return "id, job_type, target_handle, " + iso_utc("run_at") + ", status, created_by, metadata, "
           "COALESCE(last_error, ''), " + iso_utc("created_at") + ", " + iso_utc("updated_at");
}

std::variant<jobs::Job, jobs::CorruptJob> decode_job_row(const std::vector<std::optional<std::string>>& row) {
    std::string raw_id = cell(row, 0).value_or(std::string("?"));
    auto corrupt = [&](const std::string& why) { return jobs::CorruptJob{raw_id, why}; };

    jobs::Job j;
    auto id = parse_int64_strict_sv(raw_id);
    if (!id) return corrupt("bad id");
    j.id = *id;

    auto type = jobs::parse_job_type(cell(row, 1).value_or(std::string()));
    if (!type) return corrupt("unknown job_type '" + cell(row, 1).value_or(std::string()) + "'");
    j.type = *type;

    j.target_handle = cell(row, 2).value_or(std::string());
    if (j.target_handle.empty()) return corrupt("empty target_handle");

    auto run_at = timeutil::parse_iso_z(cell(row, 3).value_or(std::string()));
    if (!run_at) return corrupt("unparseable run_at");
    j.run_at = timeutil::Clock::from_time_t(*run_at);

    auto status = jobs::parse_job_status(cell(row, 4).value_or(std::string()));
    if (!status) return corrupt("unknown status '" + cell(row, 4).value_or(std::string()) + "'");
    j.status = *status;

    j.created_by = cell(row, 5).value_or(std::string());
    try {
        j.metadata = json_parse_flat_object(cell(row, 6).value_or(std::string("{}")));
    } catch (const std::runtime_error& e) {
        return corrupt(std::string("bad metadata: ") + e.what());
    }
    j.last_error = cell(row, 7).value_or(std::string());
    if (auto t = timeutil::parse_iso_z(cell(row, 8).value_or(std::string()))) j.created_at = timeutil::Clock::from_time_t(*t);
    if (auto t = timeutil::parse_iso_z(cell(row, 9).value_or(std::string()))) j.updated_at = timeutil::Clock::from_time_t(*t);
    return j;
}

PgJobStore::PgJobStore(std::shared_ptr<DbPool> pool) : pool_(std::move(pool)) {}

std::vector<jobs::Job> PgJobStore::decode_all(const DbResult& r, const char* what) {
    std::vector<jobs::Job> out;
    for (const auto& row : r.rows) {
        auto decoded = decode_job_row(row);
        if (auto j = std::get_if<jobs::Job>(&decoded)) {
            out.push_back(std::move(*j));
        } else {
            const auto& bad = std::get<jobs::CorruptJob>(decoded);
            observability::log_error("jobs.corrupt_row", {{"job_id", bad.id}, {"reason", bad.reason}, {"query", std::string(what)}});
        }
    }
    return out;
}

std::optional<jobs::Job> PgJobStore::decode_one(const DbResult& r) {
    if (r.rows.empty()) return std::nullopt;
    auto decoded = decode_job_row(r.rows.front());
    if (auto bad = std::get_if<jobs::CorruptJob>(&decoded)) {
        throw jobs::PersistenceError("corrupt job row " + bad->id + ": " + bad->reason);
    }
    return std::get<jobs::Job>(std::move(decoded));
}

jobs::CreateResult PgJobStore::create_job(const jobs::NewJob& job) {
    const std::string sql =
        "INSERT INTO jobs(job_type, target_handle, run_at, status, created_by, metadata) "
        "VALUES($1, $2, $3::timestamptz, 'SCHEDULED', $4, $5) "
        "ON CONFLICT (job_type, target_handle, run_at) WHERE status IN ('SCHEDULED','IN_PROGRESS') "
        "DO UPDATE SET created_by=EXCLUDED.created_by, metadata=EXCLUDED.metadata, updated_at=now() "
        "RETURNING id, (xmax = 0) AS inserted";
    DbResult r = exec_checked(*pool_, sql, {jobs::to_string(job.type), job.target_handle,
                                            timeutil::format_iso_z(job.run_at), job.created_by,
                                            json_emit_string_map(job.metadata)});
    if (r.rows.empty() || r.rows[0].size() < 2 || !r.rows[0][0]) throw jobs::PersistenceError("upsert returned no row");
    auto id = parse_int64_strict_sv(*r.rows[0][0]);
    if (!id) throw jobs::PersistenceError("upsert returned bad id");
    bool inserted = r.rows[0][1].value_or(std::string("f")) == "t";
    return jobs::CreateResult{*id, inserted};
}

std::optional<jobs::Job> PgJobStore::get(int64_t id) {
    DbResult r = exec_checked(*pool_, "SELECT " + job_columns() + " FROM jobs WHERE id=$1", {std::to_string(id)});
    return decode_one(r);
}

std::optional<jobs::Job> PgJobStore::claim(int64_t id) {
    DbResult r = exec_checked(*pool_,
        "UPDATE jobs SET status='IN_PROGRESS', updated_at=now() WHERE id=$1 AND status='SCHEDULED' RETURNING " + job_columns(),
        {std::to_string(id)});
    return decode_one(r);
}

bool PgJobStore::mark_done(int64_t id) {
    DbResult r = exec_checked(*pool_,
        "UPDATE jobs SET status='DONE', last_error=NULL, updated_at=now() WHERE id=$1 AND status IN ('SCHEDULED','IN_PROGRESS')",
        {std::to_string(id)});
    return r.affected_rows > 0;
}

bool PgJobStore::mark_failed(int64_t id, const std::string& reason) {
    DbResult r = exec_checked(*pool_,
        "UPDATE jobs SET status='FAILED', last_error=$2, updated_at=now() WHERE id=$1 AND status IN ('SCHEDULED','IN_PROGRESS')",
        {std::to_string(id), reason});
    return r.affected_rows > 0;
}

jobs::ScheduledScan PgJobStore::scan_scheduled() {
    DbResult r = exec_checked(*pool_,
        "SELECT " + job_columns() + " FROM jobs WHERE status='SCHEDULED' ORDER BY run_at ASC NULLS LAST, id ASC");
    jobs::ScheduledScan scan;
    for (const auto& row : r.rows) {
        auto decoded = decode_job_row(row);
        if (auto j = std::get_if<jobs::Job>(&decoded)) scan.jobs.push_back(std::move(*j));
        else scan.corrupt.push_back(std::get<jobs::CorruptJob>(std::move(decoded)));
    }
    return scan;
}

std::vector<jobs::Job> PgJobStore::list_in_progress() {
    DbResult r = exec_checked(*pool_, "SELECT " + job_columns() + " FROM jobs WHERE status='IN_PROGRESS' ORDER BY id");
    return decode_all(r, "list_in_progress");
}

std::vector<jobs::Job> PgJobStore::list_recent(std::size_t limit) {
    DbResult r = exec_checked(*pool_, "SELECT " + job_columns() + " FROM jobs ORDER BY id DESC LIMIT $1",
                              {std::to_string(limit)});
    return decode_all(r, "list_recent");
}

}
