#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "vidingest/core/config.h"
#include "vidingest/http/router.h"

namespace vidingest::http {

/// @brief HTTP server bootstrapper (acceptor, TLS context and handler pool).
///
/// Sockets are served by the io_context threads; route handlers run on a
/// dedicated worker pool so blocking store and file I/O never stalls accepts.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router);
    ~HttpServer();

    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    boost::asio::thread_pool workers_;
};

}  // namespace vidingest::http
