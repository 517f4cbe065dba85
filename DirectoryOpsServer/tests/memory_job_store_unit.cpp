
#include <chrono>
#include <iostream>
#include <string>
#include "jobs/MemoryJobStore.h"

using namespace jobs;
using std::chrono::hours;

static NewJob disable(const std::string& handle, timeutil::TimePoint at, const std::string& by) {
    NewJob j;
    j.type = JobType::DisableAccount;
    j.target_handle = handle;
    j.run_at = at;
    j.created_by = by;
    j.metadata = {{"source", "chat"}};
    return j;
}

int main() {
    const auto t0 = timeutil::Clock::now() + hours(24);

    {
        if (std::string(to_string(JobStatus::InProgress)) != "IN_PROGRESS") { std::cerr << "status name\n"; return 1; }
        if (parse_job_status("FAILED") != JobStatus::Failed) { std::cerr << "parse_job_status\n"; return 1; }
        if (parse_job_status("failed")) { std::cerr << "status names are upper case\n"; return 1; }
        if (parse_job_type("DISABLE_ACCOUNT") != JobType::DisableAccount || parse_job_type("RESET")) { std::cerr << "parse_job_type\n"; return 1; }
        if (!is_live(JobStatus::InProgress) || is_live(JobStatus::Done)) { std::cerr << "is_live\n"; return 1; }
    }

    MemoryJobStore store;
    auto a = store.create_job(disable("alice", t0, "1001"));
    if (!a.created || a.id <= 0) { std::cerr << "first create should insert\n"; return 1; }

    {
        auto again = disable("alice", t0, "1002");
        again.metadata["source"] = "mail";
        auto b = store.create_job(again);
        if (b.created || b.id != a.id) { std::cerr << "same handle and run_at should collapse onto one job\n"; return 1; }
        auto j = store.get(a.id);
        if (!j || j->created_by != "1002" || j->metadata["source"] != "mail") { std::cerr << "upsert should refresh created_by and metadata\n"; return 1; }
        if (store.snapshot().size() != 1) { std::cerr << "upsert created a second row\n"; return 1; }
    }

    auto later = store.create_job(disable("alice", t0 + hours(1), "1001"));
    if (!later.created || later.id == a.id) { std::cerr << "different run_at should create a new job\n"; return 1; }
    auto bob = store.create_job(disable("bob", t0 - hours(2), "1001"));

    {
        auto scan = store.scan_scheduled();
        if (scan.jobs.size() != 3 || !scan.corrupt.empty()) { std::cerr << "scan size\n"; return 1; }
        if (scan.jobs[0].id != bob.id || scan.jobs[2].id != later.id) { std::cerr << "scan should be ordered by run_at\n"; return 1; }
        if (store.list_scheduled().size() != 3) { std::cerr << "list_scheduled\n"; return 1; }
    }

    {
        auto c = store.claim(a.id);
        if (!c || c->status != JobStatus::InProgress) { std::cerr << "claim should move to IN_PROGRESS\n"; return 1; }
        if (store.claim(a.id)) { std::cerr << "second claim should fail\n"; return 1; }
        if (store.list_in_progress().size() != 1) { std::cerr << "list_in_progress\n"; return 1; }

        auto during = store.create_job(disable("alice", t0, "1003"));
        if (during.created || during.id != a.id) { std::cerr << "IN_PROGRESS job is still live for upsert\n"; return 1; }

        if (!store.mark_done(a.id)) { std::cerr << "mark_done\n"; return 1; }
        if (store.mark_failed(a.id, "late")) { std::cerr << "terminal job should not change\n"; return 1; }
        auto done = store.get(a.id);
        if (!done || done->status != JobStatus::Done || !done->last_error.empty()) { std::cerr << "done row\n"; return 1; }

        auto resubmit = store.create_job(disable("alice", t0, "1001"));
        if (!resubmit.created || resubmit.id == a.id) { std::cerr << "submit after DONE should create a new job\n"; return 1; }
    }

    {
        if (!store.mark_failed(bob.id, "account locked")) { std::cerr << "mark_failed from SCHEDULED\n"; return 1; }
        auto f = store.get(bob.id);
        if (!f || f->status != JobStatus::Failed || f->last_error != "account locked") { std::cerr << "failed row\n"; return 1; }
        if (store.claim(bob.id)) { std::cerr << "failed job claimed\n"; return 1; }
        if (store.claim(9999) || store.get(9999) || store.mark_done(9999)) { std::cerr << "unknown id\n"; return 1; }
    }

    {
        auto recent = store.list_recent(2);
        if (recent.size() != 2 || recent[0].id < recent[1].id) { std::cerr << "list_recent should be newest first\n"; return 1; }
    }

    {
        MemoryJobStore restarted(store.snapshot());
        if (restarted.snapshot().size() != store.snapshot().size()) { std::cerr << "restart lost rows\n"; return 1; }
        auto fresh = restarted.create_job(disable("carol", t0, "1001"));
        for (const auto& j : store.snapshot()) {
            if (j.id == fresh.id) { std::cerr << "restarted store reused an id\n"; return 1; }
        }
    }

    std::cout << "memory_job_store_unit ok\n";
    return 0;
}
