#pragma once

#include "../acl/Operators.h"

#include <memory>

namespace db {

class DbPool;

class PgAdminStore : public acl::AdminStore {
public:
    explicit PgAdminStore(std::shared_ptr<DbPool> pool);

    bool add(const std::string& user_id, const std::string& added_by) override;
    bool remove(const std::string& user_id) override;
    bool contains(const std::string& user_id) override;
    std::vector<std::string> list() override;

private:
    std::shared_ptr<DbPool> pool_;
};

}
