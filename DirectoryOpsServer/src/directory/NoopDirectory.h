#pragma once

#include "Directory.h"
#include <mutex>
#include <string>
#include <vector>

namespace directory {

// In-memory directory for development and tests. Actions always succeed and only
// flip the roster's enabled flag.
class NoopDirectory : public IdentitySearch, public ActionExecutor {
public:
    NoopDirectory();
    explicit NoopDirectory(std::vector<Identity> roster);

    // One "handle;Display Name;path;enabled" per line. Blank lines and # comments are skipped.
    // Throws DirectoryError if the file cannot be read.
    static std::vector<Identity> load_roster(const std::string& path);
    static std::vector<Identity> demo_roster();

    std::vector<Identity> search(const std::string& query, std::size_t max_results) override;
    ActionResult perform(const ActionRequest& req) override;

    std::vector<Identity> roster() const;
    std::vector<ActionRequest> performed() const;

private:
    mutable std::mutex mu_;
    std::vector<Identity> roster_;
    std::vector<ActionRequest> performed_;
};

}
