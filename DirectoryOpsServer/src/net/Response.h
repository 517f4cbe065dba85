#pragma once

#include "Request.h"
#include <boost/beast/http.hpp>
#include <string>

using Response = boost::beast::http::response<boost::beast::http::string_body>;

Response make_json_response(boost::beast::http::status st, const Request& req, std::string body);
