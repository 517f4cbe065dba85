#include "PgAuditStore.h"
#include "DbPool.h"
#include "Storage.h"
#include "../net/MiniJson.h"

namespace db {

PgAuditStore::PgAuditStore(std::shared_ptr<DbPool> pool) : pool_(std::move(pool)) {}

void PgAuditStore::append(const audit::AuditEntry& entry) {
    exec_checked(*pool_,
        "INSERT INTO audit_logs(ts, actor, action, target, details) "
        "VALUES($1::timestamptz, NULLIF($2, ''), $3, NULLIF($4, ''), $5)",
        {timeutil::format_iso_z(entry.ts), entry.actor.value_or(std::string()), entry.action,
         entry.target.value_or(std::string()), json_emit_string_map(entry.details)});
}

}
