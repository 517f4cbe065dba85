#include "PgAdminStore.h"
#include "DbPool.h"
#include "Storage.h"

namespace db {

PgAdminStore::PgAdminStore(std::shared_ptr<DbPool> pool) : pool_(std::move(pool)) {}

bool PgAdminStore::add(const std::string& user_id, const std::string& added_by) {
    DbResult r = exec_checked(*pool_,
        "INSERT INTO admins(user_id, added_by) VALUES($1, NULLIF($2, '')) ON CONFLICT (user_id) DO NOTHING",
        {user_id, added_by});
    return r.affected_rows > 0;
}

bool PgAdminStore::remove(const std::string& user_id) {
    DbResult r = exec_checked(*pool_, "DELETE FROM admins WHERE user_id=$1", {user_id});
    return r.affected_rows > 0;
}

bool PgAdminStore::contains(const std::string& user_id) {
    DbResult r = exec_checked(*pool_, "SELECT 1 FROM admins WHERE user_id=$1", {user_id});
    return !r.rows.empty();
}

std::vector<std::string> PgAdminStore::list() {
    DbResult r = exec_checked(*pool_, "SELECT user_id FROM admins ORDER BY added_at, user_id");
    std::vector<std::string> out;
    for (const auto& row : r.rows) {
        if (!row.empty() && row[0]) out.push_back(*row[0]);
    }
    return out;
}

}
