#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    enum class DirectoryBackend { NOOP, POWERSHELL };

    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = false;
    int http_threads = 4;

    std::string database_url;
    int db_workers = 2;

    std::string jwt_secret;
    std::string superadmin_id;
    std::string mail_principal = "mail-ingest";

    std::string timezone = "Europe/Moscow";
    int disable_hour = 16;

    int resolver_limit = 10;
    int raw_search_limit = 100;
    int session_ttl_sec = 0;
    int recovery_delay_ms = 5000;
    int executor_threads = 2;

    DirectoryBackend directory_backend = DirectoryBackend::NOOP;
    std::string directory_command = "powershell -NoProfile -NonInteractive -Command";
    int directory_timeout_sec = 60;
    std::string directory_search_base;
    std::string directory_roster;

    int password_length = 12;

    static Config from_env(int argc, char** argv);
};

int log_level_number(Config::LogLevel level);

}
