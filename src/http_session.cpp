#include "http_session.hpp"
#include "event_logger.hpp"

#include <chrono>

namespace passgen {

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ApiRouter& router,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , router_(router)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto ep = lowest_layer().socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ApiRouter& router,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , router_(router)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto ep = lowest_layer().socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

beast::tcp_stream& HttpSession::lowest_layer() {
    if (is_tls_) {
        return beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
    }
    return std::get<beast::tcp_stream>(stream_);
}

void HttpSession::run() {
    if (is_tls_) {
        // Perform SSL/TLS handshake before processing HTTP requests
        lowest_layer().expires_after(std::chrono::seconds(config_.connection_timeout_sec));
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure; scanners hit this constantly.
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    // Idle keep-alive connections are dropped after the timeout.
    lowest_layer().expires_after(std::chrono::seconds(config_.connection_timeout_sec));

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_body_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }

    if (ec == http::error::body_limit) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT,
                         remote_addr_, "Request body exceeds " + std::to_string(config_.max_body_size) + " bytes");
        auto res = make_error_response(http::status::payload_too_large, 11, "Request body too large");
        res.keep_alive(false);
        send_response(std::move(res));
        return;
    }

    if (ec) {
        return;
    }

    req_ = parser_->release();
    send_response(router_.route(req_, remote_addr_));
}

void HttpSession::send_response(Response&& res) {
    auto sp = std::make_shared<Response>(std::move(res));
    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INTERNAL_ERROR,
                         remote_addr_, "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    lowest_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
