
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "directory/PowerShellDirectory.h"

using namespace directory;

static PowerShellDirectory fake_shell(const std::string& sh_script, std::chrono::seconds timeout = std::chrono::seconds(5)) {
    return PowerShellDirectory({"/bin/sh", "-c", sh_script, "pwsh"}, timeout, "OU=Staff,DC=corp,DC=local");
}

int main() {
    if (ps_escape("O'Brien") != "O''Brien") { std::cerr << "quote not doubled\n"; return 1; }
    if (ps_escape("a`b\nc") != "a`bc") { std::cerr << "backtick must stay literal, control chars dropped\n"; return 1; }
    {
        const std::string quotes[] = {"\u2018", "\u2019", "\u201A", "\u201B"};
        for (const auto& q : quotes) {
            if (ps_escape("O" + q + "Brien") != "O" + q + q + "Brien") { std::cerr << "typographic quote not doubled\n"; return 1; }
        }
        std::string hostile = "O\u2019; Remove-ADUser -Identity admin -Confirm:$false; \u2019";
        if (ps_escape(hostile) != "O\u2019\u2019; Remove-ADUser -Identity admin -Confirm:$false; \u2019\u2019") {
            std::cerr << "closing quote in a name must not end the literal\n"; return 1;
        }
        // Other characters in the same UTF-8 block pass through.
        if (ps_escape("a\u2014b\u201Cc") != "a\u2014b\u201Cc") { std::cerr << "dash or double quote altered\n"; return 1; }
        if (ps_escape("\xE2\x80") != "\xE2\x80") { std::cerr << "truncated sequence\n"; return 1; }
    }

    {
        std::string s = build_search_script("O'Brien", "OU=Staff,DC=corp,DC=local", 25);
        if (s.find("$q = [WildcardPattern]::Escape('O''Brien');") == std::string::npos) { std::cerr << "search query not escaped\n"; return 1; }
        std::string star = build_search_script("*", "", 5);
        if (star.find("$q = [WildcardPattern]::Escape('*');") == std::string::npos) { std::cerr << "wildcards in the query must be escaped\n"; return 1; }
        if (s.find("SearchBase = 'OU=Staff,DC=corp,DC=local'") == std::string::npos) { std::cerr << "search base missing\n"; return 1; }
        if (s.find("-First 25") == std::string::npos || s.find("ConvertTo-Json") == std::string::npos) { std::cerr << "search shape\n"; return 1; }
        if (build_search_script("x", "", 5).find("SearchBase") != std::string::npos) { std::cerr << "empty base should be omitted\n"; return 1; }
    }
    {
        std::string s = build_reset_script("alice", "P'a$s1", true);
        if (s.find("ConvertTo-SecureString 'P''a$s1'") == std::string::npos) { std::cerr << "password not escaped\n"; return 1; }
        if (s.find("-ChangePasswordAtLogon $true") == std::string::npos) { std::cerr << "must-change missing\n"; return 1; }
        if (build_reset_script("alice", "x", false).find("ChangePasswordAtLogon") != std::string::npos) { std::cerr << "must-change not optional\n"; return 1; }
        if (build_disable_script("alice").find("Disable-ADAccount -Identity 'alice'") == std::string::npos) { std::cerr << "disable script\n"; return 1; }
    }

    {
        auto ids = parse_search_output(
            "[{\"sAMAccountName\":\"nivanova\",\"displayName\":\"Иванова Наталья\",\"distinguishedName\":\"CN=N,DC=corp\",\"Enabled\":true},"
            "{\"sAMAccountName\":\"mivanova\",\"displayName\":\"Иванова Мария\",\"distinguishedName\":null,\"Enabled\":false},"
            "{\"sAMAccountName\":null,\"displayName\":\"Ghost\"}]");
        if (ids.size() != 2) { std::cerr << "entries without handle should be dropped\n"; return 1; }
        if (ids[0].display_name != "Иванова Наталья" || !ids[0].enabled || ids[1].enabled || !ids[1].path.empty()) { std::cerr << "parsed fields\n"; return 1; }
        auto single = parse_search_output("{\"sAMAccountName\":\"alice\",\"displayName\":\"Alice Smith\"}");
        if (single.size() != 1 || single[0].handle != "alice" || !single[0].enabled) { std::cerr << "single object\n"; return 1; }
        if (!parse_search_output("").empty() || !parse_search_output("  \n").empty()) { std::cerr << "no output means no results\n"; return 1; }
    }

    {
        auto dir = fake_shell("printf '%s' '[{\"sAMAccountName\":\"alice\",\"displayName\":\"Alice Smith\"}]'");
        auto found = dir.search("alice", 10);
        if (found.size() != 1 || found[0].handle != "alice") { std::cerr << "search through subprocess\n"; return 1; }
    }
    {
        auto dir = fake_shell("echo 'The term Get-ADUser is not recognized' >&2; exit 1");
        try {
            dir.search("alice", 10);
            std::cerr << "failed search should throw\n";
            return 1;
        } catch (const DirectoryError& e) {
            if (std::string(e.what()).find("not recognized") == std::string::npos) { std::cerr << "stderr not in error\n"; return 1; }
        }
    }
    {
        auto dir = fake_shell("echo not-json");
        try {
            dir.search("alice", 10);
            std::cerr << "unparseable output should throw\n";
            return 1;
        } catch (const DirectoryError&) {}
    }

    {
        ActionRequest req;
        req.type = ActionType::DisableAccount;
        req.target = "alice";

        if (!fake_shell("printf '%s' \"$1\" | grep -q \"Disable-ADAccount -Identity 'alice'\" && echo OK").perform(req).ok) {
            std::cerr << "disable script should reach the shell as one argument\n"; return 1;
        }
        auto denied = fake_shell("echo 'Insufficient access rights' >&2; exit 1").perform(req);
        if (denied.ok || denied.timed_out || denied.reason.find("Insufficient access rights") == std::string::npos) { std::cerr << "failure reason\n"; return 1; }
        auto silent = fake_shell("exit 0").perform(req);
        if (silent.ok) { std::cerr << "missing OK marker should fail\n"; return 1; }
        auto slow = fake_shell("sleep 10", std::chrono::seconds(1)).perform(req);
        if (slow.ok || !slow.timed_out) { std::cerr << "slow action should time out\n"; return 1; }
        auto missing = PowerShellDirectory({"/nonexistent/pwsh"}, std::chrono::seconds(5), "").perform(req);
        if (missing.ok) { std::cerr << "missing shell should fail\n"; return 1; }
    }

    try {
        PowerShellDirectory bad({}, std::chrono::seconds(1), "");
        std::cerr << "empty command accepted\n";
        return 1;
    } catch (const std::invalid_argument&) {}

    std::cout << "powershell_unit ok\n";
    return 0;
}
