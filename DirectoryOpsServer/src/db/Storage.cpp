#include "Storage.h"
#include "../jobs/Job.h"
#include "../observability/Logging.h"

namespace db {

DbResult exec_checked(DbPool& pool, const std::string& sql, std::vector<std::string> params) {
    boost::system::error_code ec;
    DbResult r = pool.exec_params(sql, std::move(params), ec);
    if (ec) throw jobs::PersistenceError("database unavailable: " + ec.message());
    if (!r.ok) throw jobs::PersistenceError("statement failed [" + r.sqlstate + "]: " + r.message);
    return r;
}

void ensure_schema(DbPool& pool) {
    static const char* ddl[] = {
        "CREATE TABLE IF NOT EXISTS jobs ("
        " id BIGSERIAL PRIMARY KEY,"
        " job_type TEXT NOT NULL,"
        " target_handle TEXT NOT NULL,"
        " run_at TIMESTAMPTZ,"
        " status TEXT NOT NULL DEFAULT 'SCHEDULED',"
        " created_by TEXT NOT NULL,"
        " metadata TEXT NOT NULL DEFAULT '{}',"
        " last_error TEXT,"
        " created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
        " updated_at TIMESTAMPTZ NOT NULL DEFAULT now())",
        "CREATE UNIQUE INDEX IF NOT EXISTS jobs_live_identity ON jobs(job_type, target_handle, run_at)"
        " WHERE status IN ('SCHEDULED','IN_PROGRESS')",
        "CREATE INDEX IF NOT EXISTS jobs_status_run_at ON jobs(status, run_at)",
        "CREATE TABLE IF NOT EXISTS audit_logs ("
        " id BIGSERIAL PRIMARY KEY,"
        " ts TIMESTAMPTZ NOT NULL DEFAULT now(),"
        " actor TEXT,"
        " action TEXT NOT NULL,"
        " target TEXT,"
        " details TEXT NOT NULL DEFAULT '{}')",
        "CREATE INDEX IF NOT EXISTS audit_logs_ts ON audit_logs(ts)",
        "CREATE TABLE IF NOT EXISTS admins ("
        " user_id TEXT PRIMARY KEY,"
        " added_by TEXT,"
        " added_at TIMESTAMPTZ NOT NULL DEFAULT now())",
    };
    for (const char* stmt : ddl) exec_checked(pool, stmt);
    observability::log_info("db.schema_ready");
}

std::string iso_utc(const std::string& column) {
    return "to_char(" + column + " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"')";
}

}
