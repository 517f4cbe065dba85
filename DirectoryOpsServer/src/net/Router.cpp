#include "Router.h"
#include <boost/beast/http.hpp>

Response make_json_response(boost::beast::http::status st, const Request& req, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string strip_query(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

void Router::add_route(std::string method, std::string path, Handler h) {
    by_path_[std::move(path)][std::move(method)] = std::move(h);
}

std::vector<std::string> Router::paths() const {
    std::vector<std::string> out;
    for (const auto& p : by_path_) {
        for (const auto& m : p.second) out.push_back(m.first + " " + p.first);
    }
    return out;
}

Response Router::route(const Request& req) const {
    auto path = by_path_.find(strip_query(std::string(req.target())));
    if (path == by_path_.end()) {
        return make_json_response(boost::beast::http::status::not_found, req, "{\"error\":\"not_found\"}");
    }
    auto handler = path->second.find(std::string(req.method_string()));
    if (handler != path->second.end()) return handler->second(req);

    std::string allow;
    for (const auto& m : path->second) {
        if (!allow.empty()) allow += ", ";
        allow += m.first;
    }
    auto res = make_json_response(boost::beast::http::status::method_not_allowed, req, "{\"error\":\"method_not_allowed\"}");
    res.set(boost::beast::http::field::allow, allow);
    return res;
}
