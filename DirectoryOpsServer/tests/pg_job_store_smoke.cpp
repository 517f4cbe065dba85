#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include "db/DbPool.h"
#include "db/PgAdminStore.h"
#include "db/PgAuditStore.h"
#include "db/PgJobStore.h"
#include "db/Storage.h"

using Row = std::vector<std::optional<std::string>>;

static int check_row_decoding() {
    Row good = {std::string("42"), std::string("DISABLE_ACCOUNT"), std::string("alice"), std::string("2030-01-10T13:00:00Z"),
                std::string("SCHEDULED"), std::string("100"), std::string("{\"source\":\"text\"}"), std::string(""),
                std::string("2029-12-01T10:00:00Z"), std::string("2029-12-01T10:00:00Z")};
    auto decoded = db::decode_job_row(good);
    auto job = std::get_if<jobs::Job>(&decoded);
    if (!job) { std::cerr << "good row rejected: " << std::get<jobs::CorruptJob>(decoded).reason << "\n"; return 1; }
    if (job->id != 42 || job->target_handle != "alice" || job->metadata["source"] != "text") { std::cerr << "good row fields\n"; return 1; }
    if (timeutil::format_iso_z(job->run_at) != "2030-01-10T13:00:00Z") { std::cerr << "run_at decode\n"; return 1; }

    auto expect_corrupt = [&](std::size_t col, std::optional<std::string> value, const char* what) {
        Row bad = good;
        bad[col] = std::move(value);
        auto d = db::decode_job_row(bad);
        if (!std::holds_alternative<jobs::CorruptJob>(d)) { std::cerr << "accepted corrupt row: " << what << "\n"; return false; }
        return true;
    };
    if (!expect_corrupt(0, std::string("x1"), "id")) return 1;
    if (!expect_corrupt(1, std::string("delete_everything"), "type")) return 1;
    if (!expect_corrupt(2, std::nullopt, "target")) return 1;
    if (!expect_corrupt(3, std::string("tomorrow"), "run_at")) return 1;
    if (!expect_corrupt(3, std::nullopt, "null run_at")) return 1;
    if (!expect_corrupt(4, std::string("PAUSED"), "status")) return 1;
    if (!expect_corrupt(6, std::string("{broken"), "metadata")) return 1;
    return 0;
}

int main() {
    if (int rc = check_row_decoding()) return rc;

    const char* url = std::getenv("DATABASE_URL");
    if (!url) {
        std::cout << "pg_job_store_smoke skipped: DATABASE_URL not set\n";
        return 77;
    }

    auto pool = std::make_shared<db::DbPool>(std::string(url), 2);
    db::ensure_schema(*pool);
    db::ensure_schema(*pool);

    db::PgJobStore store(pool);
    std::string handle = "smoke_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    auto run_at = timeutil::Clock::now() + std::chrono::hours(24 * 365);

    jobs::NewJob nj;
    nj.target_handle = handle;
    nj.run_at = run_at;
    nj.created_by = "100";
    nj.metadata["source"] = "text";
    auto first = store.create_job(nj);
    if (!first.created || first.id <= 0) { std::cerr << "first create\n"; return 1; }

    nj.created_by = "200";
    nj.metadata["source"] = "mail";
    auto again = store.create_job(nj);
    if (again.created || again.id != first.id) { std::cerr << "upsert should reuse the live row\n"; return 1; }
    auto got = store.get(first.id);
    if (!got || got->created_by != "200" || got->metadata["source"] != "mail") { std::cerr << "upsert should replace submitter\n"; return 1; }

    bool listed = false;
    for (const auto& j : store.list_scheduled()) if (j.id == first.id) listed = true;
    if (!listed) { std::cerr << "scheduled scan missing job\n"; return 1; }

    auto claimed = store.claim(first.id);
    if (!claimed || claimed->status != jobs::JobStatus::InProgress) { std::cerr << "claim\n"; return 1; }
    if (store.claim(first.id)) { std::cerr << "second claim must fail\n"; return 1; }
    if (!store.mark_failed(first.id, "directory timeout")) { std::cerr << "mark_failed\n"; return 1; }
    if (store.mark_done(first.id)) { std::cerr << "terminal job must not change\n"; return 1; }
    got = store.get(first.id);
    if (!got || got->status != jobs::JobStatus::Failed || got->last_error != "directory timeout") { std::cerr << "failed state\n"; return 1; }

    auto fresh = store.create_job(nj);
    if (!fresh.created || fresh.id == first.id) { std::cerr << "terminal job should not absorb a new submit\n"; return 1; }
    if (!store.mark_done(fresh.id)) { std::cerr << "mark_done from scheduled\n"; return 1; }

    db::PgAuditStore audit(pool);
    if (!audit.record(std::string("100"), "disable_account", handle, {{"result", "ok"}})) { std::cerr << "audit append\n"; return 1; }
    if (!audit.record(std::nullopt, "disable_account", handle)) { std::cerr << "system audit append\n"; return 1; }

    db::PgAdminStore admins(pool);
    if (!admins.add(handle, "100") || admins.add(handle, "100")) { std::cerr << "admin add\n"; return 1; }
    if (!admins.contains(handle) || !admins.remove(handle) || admins.contains(handle)) { std::cerr << "admin remove\n"; return 1; }

    std::cout << "pg_job_store_smoke ok\n";
    return 0;
}
