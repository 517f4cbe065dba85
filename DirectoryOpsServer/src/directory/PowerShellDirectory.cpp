#include "PowerShellDirectory.h"
#include "ScriptRunner.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

#include <sstream>

namespace directory {

std::string ps_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) continue;
        if (c == '\'') {
            out += "''";
            continue;
        }
        // U+2018..U+201B are E2 80 98..9B in UTF-8; PowerShell closes single-quoted strings on them too.
        if (static_cast<unsigned char>(c) == 0xE2 && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x80) {
            unsigned char third = static_cast<unsigned char>(s[i + 2]);
            if (third >= 0x98 && third <= 0x9B) {
                std::string quote = s.substr(i, 3);
                out += quote;
                out += quote;
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string build_search_script(const std::string& query, const std::string& search_base, std::size_t max_results) {
    std::ostringstream ss;
    ss << "Import-Module ActiveDirectory;\n";
    ss << "$q = [WildcardPattern]::Escape('" << ps_escape(query) << "');\n";
    ss << "$params = @{ LDAPFilter = '(objectClass=user)'; Properties = 'displayName','distinguishedName','enabled','sAMAccountName' };\n";
    if (!search_base.empty()) ss << "$params.SearchBase = '" << ps_escape(search_base) << "';\n";
    ss << "Get-ADUser @params |\n";
    ss << "  Where-Object { $_.displayName -like \"*$q*\" -or $_.sAMAccountName -like \"*$q*\" -or $_.Name -like \"*$q*\" } |\n";
    ss << "  Select-Object -First " << max_results << " sAMAccountName, displayName, distinguishedName, Enabled |\n";
    ss << "  ConvertTo-Json -Compress";
    return ss.str();
}

std::string build_reset_script(const std::string& handle, const std::string& password, bool must_change) {
    std::ostringstream ss;
    ss << "Import-Module ActiveDirectory;\n";
    ss << "$sam = '" << ps_escape(handle) << "';\n";
    ss << "$pwd = ConvertTo-SecureString '" << ps_escape(password) << "' -AsPlainText -Force;\n";
    ss << "Set-ADAccountPassword -Identity $sam -Reset -NewPassword $pwd;\n";
    if (must_change) ss << "Set-ADUser -Identity $sam -ChangePasswordAtLogon $true;\n";
    ss << "Write-Output 'OK'";
    return ss.str();
}

std::string build_disable_script(const std::string& handle) {
    std::ostringstream ss;
    ss << "Import-Module ActiveDirectory;\n";
    ss << "Disable-ADAccount -Identity '" << ps_escape(handle) << "';\n";
    ss << "Write-Output 'OK'";
    return ss.str();
}

std::vector<Identity> parse_search_output(const std::string& json) {
    std::vector<Identity> out;
    for (const auto& item : json_split_array(json)) {
        Identity id;
        id.handle = json_extract_string(item, "sAMAccountName");
        id.display_name = json_extract_string(item, "displayName");
        id.path = json_extract_string(item, "distinguishedName");
        auto enabled = json_extract_bool_present(item, "Enabled");
        id.enabled = enabled.first ? enabled.second : true;
        if (id.handle.empty()) continue;
        out.push_back(std::move(id));
    }
    return out;
}

PowerShellDirectory::PowerShellDirectory(std::vector<std::string> command_prefix, std::chrono::seconds timeout, std::string search_base)
    : command_prefix_(std::move(command_prefix)), timeout_(timeout), search_base_(std::move(search_base)) {
    if (command_prefix_.empty()) throw std::invalid_argument("directory command is empty");
}

PowerShellDirectory::Output PowerShellDirectory::invoke(const std::string& script) {
    std::vector<std::string> argv = command_prefix_;
    argv.push_back(script);
    RunResult r = run_process(argv, timeout_);
    if (r.timed_out) return {false, true, r.out, "timeout"};
    if (r.exit_code != 0) {
        std::string reason = r.err.empty() ? "exit code " + std::to_string(r.exit_code) : r.err;
        if (reason.size() > 500) reason.resize(500);
        return {false, false, r.out, reason};
    }
    return {true, false, r.out, std::string()};
}

std::vector<Identity> PowerShellDirectory::search(const std::string& query, std::size_t max_results) {
    auto res = invoke(build_search_script(query, search_base_, max_results));
    if (!res.ok) throw DirectoryError("search failed: " + res.reason);
    try {
        return parse_search_output(res.out);
    } catch (const std::runtime_error& e) {
        throw DirectoryError(std::string("unparseable search output: ") + e.what());
    }
}

ActionResult PowerShellDirectory::perform(const ActionRequest& req) {
    std::string script = req.type == ActionType::ResetPassword
        ? build_reset_script(req.target, req.new_password, req.must_change_password)
        : build_disable_script(req.target);
    Output res;
    try {
        res = invoke(script);
    } catch (const DirectoryError& e) {
        return ActionResult::failure(e.what());
    }
    observability::log_info("directory.action", {{"action", std::string(to_string(req.type))}, {"target", req.target}, {"ok", int64_t(res.ok ? 1 : 0)}});
    if (!res.ok) return ActionResult::failure(res.reason, res.timed_out);
    if (res.out.find("OK") == std::string::npos) return ActionResult::failure("unexpected output");
    return ActionResult::success();
}

}
