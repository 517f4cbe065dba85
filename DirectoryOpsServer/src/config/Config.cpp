#include "Config.h"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static int getenv_int_or(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    try {
        size_t used = 0;
        int out = std::stoi(v, &used);
        if (used != std::string(v).size()) return def;
        return out;
    } catch (const std::exception&) {
        return def;
    }
}

static bool getenv_flag_or(const char* name, bool def) {
    std::string v = getenv_or(name, def ? "1" : "0");
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return !(v == "0" || v == "false" || v == "no" || v == "off");
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN" || u == "WARNING") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static Config::DirectoryBackend parse_backend(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::tolower);
    if (u == "powershell" || u == "ad") return Config::DirectoryBackend::POWERSHELL;
    return Config::DirectoryBackend::NOOP;
}

int log_level_number(Config::LogLevel level) {
    switch (level) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    int port = getenv_int_or("PORT", 8080);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i + 1 < argc) {
            try { port = std::stoi(argv[i + 1]); } catch (const std::exception&) {}
        }
    }
    if (port > 0 && port <= 65535) c.port = static_cast<uint16_t>(port);

    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_flag_or("METRICS_ENABLED", true);
    c.access_log = getenv_flag_or("ACCESS_LOG", false);
    c.http_threads = std::clamp(getenv_int_or("HTTP_THREADS", 4), 1, 64);

    c.database_url = getenv_or("DATABASE_URL", "");
    c.db_workers = std::clamp(getenv_int_or("DB_WORKERS", 2), 1, 64);

    c.jwt_secret = getenv_or("JWT_SECRET", "");
    c.superadmin_id = getenv_or("SUPERADMIN_ID", "");
    c.mail_principal = getenv_or("MAIL_PRINCIPAL", "mail-ingest");

    c.timezone = getenv_or("TIMEZONE", "Europe/Moscow");
    c.disable_hour = getenv_int_or("DISABLE_HOUR", 16);
    if (c.disable_hour < 0 || c.disable_hour > 23) c.disable_hour = 16;

    c.resolver_limit = std::clamp(getenv_int_or("RESOLVER_LIMIT", 10), 1, 50);
    c.raw_search_limit = std::clamp(getenv_int_or("RAW_SEARCH_LIMIT", 100), 1, 1000);
    c.session_ttl_sec = std::max(0, getenv_int_or("SESSION_TTL_SEC", 0));
    c.recovery_delay_ms = std::max(0, getenv_int_or("RECOVERY_DELAY_MS", 5000));
    c.executor_threads = std::clamp(getenv_int_or("EXECUTOR_THREADS", 2), 1, 32);

    c.directory_backend = parse_backend(getenv_or("DIRECTORY_BACKEND", "noop"));
    c.directory_command = getenv_or("DIRECTORY_COMMAND", "powershell -NoProfile -NonInteractive -Command");
    c.directory_timeout_sec = std::clamp(getenv_int_or("DIRECTORY_TIMEOUT_SEC", 60), 1, 3600);
    c.directory_search_base = getenv_or("DIRECTORY_SEARCH_BASE", "");
    c.directory_roster = getenv_or("DIRECTORY_ROSTER", "");

    c.password_length = std::clamp(getenv_int_or("PASSWORD_LENGTH", 12), 8, 128);
    return c;
}

}
