#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <memory>
#include <string>

// Accept loop plus one Session per connection. Routing runs on cpu_pool; the socket is
// only touched from its own executor.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::shared_ptr<boost::asio::thread_pool> cpu_pool);
    void run();
    void stop();
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<boost::asio::thread_pool> cpu_pool_;
};
