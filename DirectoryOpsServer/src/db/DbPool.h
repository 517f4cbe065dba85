#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/system/error_code.hpp>

namespace db {

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

// Fixed set of worker threads, each owning one libpq connection. A broken connection is
// re-established once per statement.
class DbPool {
public:
    explicit DbPool(const std::string& conninfo, int workers = 2);
    ~DbPool();

    // Blocks the caller until a worker has run the statement. Must not be called from a
    // worker thread. ec is set when no connection could be used.
    DbResult exec_params(const std::string& sql, std::vector<std::string> params, boost::system::error_code& ec);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
