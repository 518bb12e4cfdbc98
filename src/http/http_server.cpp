#include "vidingest/http/http_server.h"

#include <array>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "vidingest/core/ids.h"
#include "vidingest/core/logger.h"
#include "vidingest/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 65536;

http::response<http::string_body> ErrorResponse(http::status status, int version,
                                                const std::string& code,
                                                const std::string& message,
                                                const std::string& request_id) {
    // Consistent error envelope for client troubleshooting.
    http::response<http::string_body> response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = "{\"error\":{\"code\":\"" + code + "\",\"message\":\"" +
                      vidingest::core::EscapeJson(message) + "\",\"request_id\":\"" +
                      request_id + "\"}}";
    response.prepare_payload();
    return response;
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, const vidingest::http::Router& router,
            const vidingest::core::Config& config, net::thread_pool& workers)
        : stream_(std::move(stream)), router_(router), config_(config), workers_(workers) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            ArmTimeout();
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void ArmTimeout() {
        beast::get_lowest_layer(stream_).expires_after(
            std::chrono::seconds(config_.server.limits.request_timeout_seconds));
    }

    void OnHandshake(beast::error_code ec) {
        if (ec) {
            vidingest::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        ArmTimeout();
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == beast::error::timeout) {
            return DoClose();
        }
        if (ec) {
            vidingest::core::LogError("Read header failed: " + ec.message());
            return;
        }

        entry_ = {};
        entry_.request_id = vidingest::core::GenerateRequestId();
        entry_.method = std::string(parser_->get().method_string());
        entry_.target = std::string(parser_->get().target());
        entry_.remote = GetRemoteAddress(&remote_host_);
        request_start_ = std::chrono::steady_clock::now();

        body_.clear();
        if (parser_->is_done()) {
            return HandleRequest();
        }
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            auto response = ErrorResponse(http::status::payload_too_large,
                                          parser_->get().version(), "FILE_TOO_LARGE",
                                          "request body exceeds limit", entry_.request_id);
            response.keep_alive(false);
            return Send(std::move(response));
        }
        if (ec == beast::error::timeout) {
            vidingest::core::LogWarning("request " + entry_.request_id +
                                        " timed out reading body");
            return DoClose();
        }
        if (ec && ec != http::error::need_buffer) {
            vidingest::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        entry_.request_bytes += bytes;
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        auto request = std::make_shared<vidingest::http::HttpRequest>();
        request->method(parser_->get().method());
        request->target(parser_->get().target());
        request->version(parser_->get().version());
        request->keep_alive(parser_->get().keep_alive());
        for (const auto& field : parser_->get()) {
            request->set(field.name_string(), field.value());
        }
        request->body() = std::move(body_);
        body_.clear();
        request->prepare_payload();

        vidingest::http::RequestContext ctx;
        ctx.request_id = entry_.request_id;
        ctx.method = entry_.method;
        ctx.target = entry_.target;
        ctx.remote = entry_.remote;
        ctx.remote_host = remote_host_;

        // No socket operation is pending while the handler runs.
        beast::get_lowest_layer(stream_).expires_never();
        net::post(workers_, [self = this->shared_from_this(), request, ctx]() {
            auto result = self->RunHandler(ctx, *request);
            net::post(beast::get_lowest_layer(self->stream_).get_executor(),
                      [self, request, result = std::move(result)]() mutable {
                          self->Respond(*request, std::move(result));
                      });
        });
    }

    vidingest::core::Result<vidingest::http::HttpResponse> RunHandler(
        const vidingest::http::RequestContext& ctx, const vidingest::http::HttpRequest& request) {
        try {
            return router_.Route(ctx, request);
        } catch (const std::exception& ex) {
            return vidingest::core::Error{vidingest::core::ErrorCode::kInternal, ex.what()};
        }
    }

    void Respond(const vidingest::http::HttpRequest& request,
                 vidingest::core::Result<vidingest::http::HttpResponse> result) {
        if (!result.ok()) {
            vidingest::core::LogError("request " + entry_.request_id + " failed: " +
                                      result.error().message);
            auto response = ErrorResponse(http::status::internal_server_error, request.version(),
                                          "INTERNAL", "internal server error", entry_.request_id);
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }
        auto response = std::move(result.value());
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "vidingest");
        response.set("X-Request-Id", entry_.request_id);
        entry_.status = static_cast<int>(response.result_int());
        entry_.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - request_start_)
                                .count();
        entry_.response_bytes = response.payload_size().value_or(0);
        vidingest::core::LogRequest(entry_);
        vidingest::observability::RecordRequest(entry_.status, entry_.latency_ms);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        ArmTimeout();
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            vidingest::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress(std::string* host_out) const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            *host_out = "unknown";
            return "unknown";
        }
        *host_out = endpoint.address().to_string();
        return *host_out + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    const vidingest::http::Router& router_;
    const vidingest::core::Config& config_;
    net::thread_pool& workers_;

    vidingest::core::RequestLogEntry entry_;
    std::string remote_host_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, const vidingest::http::Router& router,
             const vidingest::core::Config& config, net::thread_pool& workers,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc), router_(router), config_(config), workers_(workers), ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw std::runtime_error("failed to listen on " + endpoint.address().to_string() +
                                     ":" + std::to_string(endpoint.port()) + ": " + ec.message());
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            vidingest::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, workers_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             workers_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    const vidingest::http::Router& router_;
    const vidingest::core::Config& config_;
    net::thread_pool& workers_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace vidingest::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      workers_(static_cast<std::size_t>(config.server.worker_threads)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

HttpServer::~HttpServer() {
    workers_.join();
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, workers_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
    core::LogInfo("listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port) + " with " +
                  std::to_string(config_.server.worker_threads) + " handler threads");
}

}  // namespace vidingest::http
