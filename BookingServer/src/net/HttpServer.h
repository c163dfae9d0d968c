#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <chrono>
#include <string>

class HttpServer {
public:
    // Throws boost::system::system_error when the address cannot be bound.
    HttpServer(boost::asio::io_context& ioc, const std::string& host, unsigned short port, Router& router, bool metrics_enabled, bool access_log);
    void run();
    unsigned short local_port() const;
    // Upper bound for an async handler to answer; 500 and close afterwards.
    void set_response_timeout(std::chrono::seconds t);
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::chrono::seconds response_timeout_{300};
};
