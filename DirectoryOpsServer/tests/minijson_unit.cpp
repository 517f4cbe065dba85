
#include <iostream>
#include <map>
#include <string>
#include <optional>
#include <stdexcept>
#include "net/MiniJson.h"

template <typename F>
static bool throws(F f) {
    try { f(); } catch (const std::runtime_error&) { return true; }
    return false;
}

int main() {
    if (json_escape_resp("abc") != "abc") { std::cerr << "json_escape_resp changed plain text\n"; return 1; }
    if (json_escape_resp("a\"b") != "a\\\"b") { std::cerr << "json_escape_resp did not escape quote\n"; return 1; }
    if (json_escape_resp("a\\b") != "a\\\\b") { std::cerr << "json_escape_resp did not escape backslash\n"; return 1; }
    if (json_escape_resp("\n\t\r") != "\\n\\t\\r") { std::cerr << "json_escape_resp did not escape control chars\n"; return 1; }
    if (json_escape_resp(std::string(1, '\x01')) != "\\u0001") { std::cerr << "json_escape_resp low control char\n"; return 1; }
    if (json_escape_resp("привет") != "привет") { std::cerr << "json_escape_resp altered utf-8\n"; return 1; }

    {
        auto pr = json_extract_string_present("{\"text\":\"заблокировать Иванова\"}", "text");
        if (!pr.first || pr.second != "заблокировать Иванова") { std::cerr << "json_extract_string_present utf-8 value\n"; return 1; }
    }
    {
        auto pr = json_extract_string_present("{\"a\":\"\\u0418\\u0432\"}", "a");
        if (pr.second != "Ив") { std::cerr << "unicode escape not decoded: " << pr.second << "\n"; return 1; }
    }
    {
        auto pr = json_extract_string_present("{\"nested\":{\"text\":\"x\"},\"text\":\"y\"}", "text");
        if (pr.second != "y") { std::cerr << "nested member leaked into top level\n"; return 1; }
    }
    if (json_extract_string("{}", "nope") != "") { std::cerr << "missing key should give empty\n"; return 1; }
    if (json_extract_string_present("{}", "nope").first) { std::cerr << "missing key reported present\n"; return 1; }

    {
        auto p = json_extract_string_opt_present("{\"a\":null}", "a");
        if (!p.first || p.second.has_value()) { std::cerr << "null should be present without value\n"; return 1; }
    }

    if (!throws([] { json_extract_string_present("{\"a\":123}", "a"); })) { std::cerr << "numeric accepted as string\n"; return 1; }
    if (!throws([] { json_extract_string("{", "a"); })) { std::cerr << "truncated object accepted\n"; return 1; }
    if (!throws([] { json_extract_string("{a:1}", "a"); })) { std::cerr << "unquoted key accepted\n"; return 1; }
    if (!throws([] { json_extract_string("{\"a\":\"\\q\"}", "a"); })) { std::cerr << "bad escape accepted\n"; return 1; }

    {
        auto pi = json_extract_int_present("{\"n\":42}", "n");
        if (!pi.first || pi.second != 42) { std::cerr << "json_extract_int_present failed to parse 42\n"; return 1; }
        auto oi = json_extract_int_opt("{\"n\":-7}", "n");
        if (!oi || *oi != -7) { std::cerr << "json_extract_int_opt failed\n"; return 1; }
        if (json_extract_int_opt("{\"n\":null}", "n").has_value()) { std::cerr << "null int should be nullopt\n"; return 1; }
        if (!throws([] { json_extract_int_opt("{\"n\":99999999999999999999}", "n"); })) { std::cerr << "overflow accepted\n"; return 1; }
    }
    {
        auto b = json_extract_bool_present("{\"enabled\":false}", "enabled");
        if (!b.first || b.second) { std::cerr << "json_extract_bool_present false\n"; return 1; }
    }

    {
        auto arr = json_split_array("[{\"a\":1},{\"b\":\"x,y\"}]");
        if (arr.size() != 2 || arr[1] != "{\"b\":\"x,y\"}") { std::cerr << "json_split_array elements\n"; return 1; }
        if (json_split_array("{\"a\":1}").size() != 1) { std::cerr << "bare object should be one element\n"; return 1; }
        if (!json_split_array("").empty() || !json_split_array("null").empty()) { std::cerr << "empty input should give none\n"; return 1; }
        if (!throws([] { json_split_array("[1,2] x"); })) { std::cerr << "trailing data accepted\n"; return 1; }
    }

    {
        auto m = json_parse_flat_object("{\"SamAccountName\":\"alice\",\"Enabled\":true,\"Path\":null}");
        if (m["SamAccountName"] != "alice" || m["Enabled"] != "true" || m.count("Path")) { std::cerr << "json_parse_flat_object mismatch\n"; return 1; }
    }

    {
        std::map<std::string, std::string> m{{"source", "mail"}, {"display_name", "Иванов \"И\""}};
        std::string js = json_emit_string_map(m);
        if (json_extract_string(js, "display_name") != "Иванов \"И\"") { std::cerr << "emitted map did not parse back\n"; return 1; }
        if (json_emit_string_or_null(std::nullopt) != "null") { std::cerr << "json_emit_string_or_null null\n"; return 1; }
        if (json_emit_string_or_null(std::string("x")) != "\"x\"") { std::cerr << "json_emit_string_or_null value\n"; return 1; }
    }

    std::cout << "minijson_unit ok\n";
    return 0;
}
