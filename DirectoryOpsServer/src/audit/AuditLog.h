#pragma once

#include "../timeutil/Time.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace audit {

struct AuditEntry {
    timeutil::TimePoint ts;
    std::optional<std::string> actor;   // nullopt for system-originated actions
    std::string action;
    std::optional<std::string> target;
    std::map<std::string, std::string> details;
};

// Append-only audit trail. record() never throws: a failed append is logged and counted.
class AuditLog {
public:
    virtual ~AuditLog() = default;

    bool record(const std::optional<std::string>& actor, const std::string& action,
                const std::optional<std::string>& target,
                const std::map<std::string, std::string>& details = {});

protected:
    virtual void append(const AuditEntry& entry) = 0;
};

class MemoryAuditLog : public AuditLog {
public:
    std::vector<AuditEntry> entries() const;
    std::vector<AuditEntry> entries_for(const std::string& action) const;
    std::size_t size() const;

protected:
    void append(const AuditEntry& entry) override;

private:
    mutable std::mutex mu_;
    std::vector<AuditEntry> entries_;
};

}
