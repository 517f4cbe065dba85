#pragma once

#include "DbPool.h"

#include <string>
#include <vector>

namespace db {

// Runs a statement and throws jobs::PersistenceError unless it succeeded.
DbResult exec_checked(DbPool& pool, const std::string& sql, std::vector<std::string> params = {});

// Idempotent DDL for jobs, audit_logs and admins.
void ensure_schema(DbPool& pool);

// "YYYY-MM-DDTHH:MM:SSZ" projection of a timestamptz column.
std::string iso_utc(const std::string& column);

}
