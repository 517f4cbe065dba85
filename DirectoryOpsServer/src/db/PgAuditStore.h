#pragma once

#include "../audit/AuditLog.h"

#include <memory>

namespace db {

class DbPool;

class PgAuditStore : public audit::AuditLog {
public:
    explicit PgAuditStore(std::shared_ptr<DbPool> pool);

protected:
    void append(const audit::AuditEntry& entry) override;

private:
    std::shared_ptr<DbPool> pool_;
};

}
