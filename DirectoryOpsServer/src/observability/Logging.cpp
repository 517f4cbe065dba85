#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{2};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level = std::clamp(level, 1, 4); }

int log_level() { return g_level; }

int parse_log_level(const std::string& name) {
    std::string u = name;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return 1;
    if (u == "INFO") return 2;
    if (u == "WARN" || u == "WARNING") return 3;
    if (u == "ERROR") return 4;
    return 2;
}

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream u;
                    u << "\\u" << std::hex << std::setw(4) << std::setfill('0') << int(static_cast<unsigned char>(c));
                    out += u.str();
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

static void write_value(std::ostringstream& ss, const FieldValue& v) {
    if (std::holds_alternative<std::string>(v)) {
        ss << '\"' << escape_json(std::get<std::string>(v)) << '\"';
    } else if (std::holds_alternative<int64_t>(v)) {
        ss << std::get<int64_t>(v);
    } else {
        std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(v);
        ss << tmp.str();
    }
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << now_ms() << ',';
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        write_value(ss, p.second);
    }
    ss << "}\n";
    std::lock_guard lock(g_out_mu);
    std::cout << ss.str() << std::flush;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(4, "ERROR", msg, fields); }

} // namespace observability
