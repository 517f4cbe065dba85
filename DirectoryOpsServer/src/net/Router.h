#pragma once

#include "Request.h"
#include "Response.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

// Dispatch on the exact path (query string ignored), then on the method. A known path with
// an unregistered method is a 405 that lists the registered methods in Allow.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;

    void add_route(std::string method, std::string path, Handler h);
    Response route(const Request& req) const;

    // "METHOD /path" for every registered route, sorted by path.
    std::vector<std::string> paths() const;

private:
    std::map<std::string, std::map<std::string, Handler>> by_path_;
};

std::string strip_query(const std::string& target);
