#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

// 1 debug, 2 info, 3 warn, 4 error
void set_log_level(int level);
int log_level();
int parse_log_level(const std::string& name);

}
