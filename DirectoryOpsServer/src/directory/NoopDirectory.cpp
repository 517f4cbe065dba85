#include "NoopDirectory.h"
#include "../observability/Logging.h"
#include "../text/Utf8.h"

#include <fstream>
#include <sstream>

namespace directory {

NoopDirectory::NoopDirectory() : roster_(demo_roster()) {}

NoopDirectory::NoopDirectory(std::vector<Identity> roster) : roster_(std::move(roster)) {}

std::vector<Identity> NoopDirectory::demo_roster() {
    return {
        {"nivanova", "Иванова Наталья", "CN=Иванова Наталья,OU=Staff,DC=corp,DC=local", true},
        {"mivanova", "Иванова Мария", "CN=Иванова Мария,OU=Staff,DC=corp,DC=local", true},
        {"ppetrov", "Петров Пётр", "CN=Петров Пётр,OU=Staff,DC=corp,DC=local", true},
        {"nustinova", "Устинова Наталья", "CN=Устинова Наталья,OU=Finance,DC=corp,DC=local", true},
        {"alice", "Alice Smith", "CN=Alice Smith,OU=IT,DC=corp,DC=local", true},
    };
}

std::vector<Identity> NoopDirectory::load_roster(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw DirectoryError("cannot open roster file: " + path);
    std::vector<Identity> out;
    std::string line;
    while (std::getline(in, line)) {
        line = text::trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::vector<std::string> parts;
        std::stringstream ss(line);
        std::string part;
        while (std::getline(ss, part, ';')) parts.push_back(text::trim(part));
        if (parts.empty() || parts[0].empty()) continue;
        Identity id;
        id.handle = parts[0];
        if (parts.size() > 1) id.display_name = parts[1];
        if (parts.size() > 2) id.path = parts[2];
        if (parts.size() > 3) id.enabled = !(parts[3] == "0" || parts[3] == "false");
        out.push_back(std::move(id));
    }
    return out;
}

std::vector<Identity> NoopDirectory::search(const std::string& query, std::size_t max_results) {
    std::string q = text::fold_utf8(text::trim(query));
    std::vector<Identity> out;
    if (q.empty()) return out;
    std::lock_guard lock(mu_);
    for (const auto& id : roster_) {
        if (out.size() >= max_results) break;
        if (text::fold_utf8(id.display_name).find(q) != std::string::npos ||
            text::fold_utf8(id.handle).find(q) != std::string::npos ||
            text::fold_utf8(id.path).find(q) != std::string::npos) {
            out.push_back(id);
        }
    }
    return out;
}

ActionResult NoopDirectory::perform(const ActionRequest& req) {
    std::lock_guard lock(mu_);
    performed_.push_back(req);
    for (auto& id : roster_) {
        if (id.handle != req.target) continue;
        if (req.type == ActionType::DisableAccount) id.enabled = false;
    }
    observability::log_info("directory.noop_action", {{"action", std::string(to_string(req.type))}, {"target", req.target}});
    return ActionResult::success("noop");
}

std::vector<Identity> NoopDirectory::roster() const {
    std::lock_guard lock(mu_);
    return roster_;
}

std::vector<ActionRequest> NoopDirectory::performed() const {
    std::lock_guard lock(mu_);
    return performed_;
}

}
