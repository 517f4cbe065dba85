
#include <iostream>
#include <stdexcept>
#include <string>
#include "audit/AuditLog.h"
#include "observability/Metrics.h"

namespace {

class BrokenAudit : public audit::AuditLog {
protected:
    void append(const audit::AuditEntry&) override { throw std::runtime_error("connection refused"); }
};

}

int main() {
    auto& metrics = observability::Metrics::instance();

    audit::MemoryAuditLog log;
    if (!log.record(std::string("1001"), "schedule_disable", std::string("alice"), {{"job_id", "1"}})) {
        std::cerr << "record should succeed\n"; return 1;
    }
    log.record(std::nullopt, "disable_account", std::string("alice"), {{"result", "done"}});
    log.record(std::string("1001"), "add_admin", std::string("2002"));

    auto all = log.entries();
    if (all.size() != 3 || log.size() != 3) { std::cerr << "expected three entries\n"; return 1; }
    if (all[0].action != "schedule_disable" || all[0].details.at("job_id") != "1") { std::cerr << "first entry content\n"; return 1; }
    if (all[1].actor.has_value()) { std::cerr << "system entry should have no actor\n"; return 1; }
    if (all[0].ts > all[2].ts) { std::cerr << "entries out of order\n"; return 1; }

    auto disables = log.entries_for("disable_account");
    if (disables.size() != 1 || disables[0].details.at("result") != "done") { std::cerr << "entries_for\n"; return 1; }
    if (!log.entries_for("remove_admin").empty()) { std::cerr << "entries_for unknown action\n"; return 1; }

    auto failed_before = metrics.event_count("audit", "failed");
    BrokenAudit broken;
    if (broken.record(std::string("1001"), "reset_password", std::string("alice"))) { std::cerr << "failed append reported success\n"; return 1; }
    if (metrics.event_count("audit", "failed") != failed_before + 1) { std::cerr << "audit failure not counted\n"; return 1; }

    std::cout << "audit_unit ok\n";
    return 0;
}
