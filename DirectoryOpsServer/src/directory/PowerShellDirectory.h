#pragma once

#include "Directory.h"
#include <chrono>
#include <string>
#include <vector>

namespace directory {

// Quotes a value for a single-quoted PowerShell literal: doubles ' and the typographic single
// quotes U+2018..U+201B, drops control characters. Backticks are literal there and pass through.
std::string ps_escape(const std::string& s);

std::string build_search_script(const std::string& query, const std::string& search_base, std::size_t max_results);
std::string build_reset_script(const std::string& handle, const std::string& password, bool must_change);
std::string build_disable_script(const std::string& handle);

// Output of ConvertTo-Json: an array of objects, a single object, or nothing.
std::vector<Identity> parse_search_output(const std::string& json);

// Active Directory through the PowerShell module, one subprocess per call.
class PowerShellDirectory : public IdentitySearch, public ActionExecutor {
public:
    PowerShellDirectory(std::vector<std::string> command_prefix, std::chrono::seconds timeout, std::string search_base);

    std::vector<Identity> search(const std::string& query, std::size_t max_results) override;
    ActionResult perform(const ActionRequest& req) override;

private:
    struct Output { bool ok; bool timed_out; std::string out; std::string reason; };
    Output invoke(const std::string& script);

    std::vector<std::string> command_prefix_;
    std::chrono::seconds timeout_;
    std::string search_base_;
};

}
