#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "api_router.hpp"

namespace passgen {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;


// One keep-alive HTTP connection. Reads requests, hands them to the ApiRouter and writes the
// responses back, over either a TLS or a plain TCP stream.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        ApiRouter& router,
        std::shared_ptr<void> conn_guard
    );

    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        ApiRouter& router,
        std::shared_ptr<void> conn_guard
    );

    ~HttpSession() = default;

    void run();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    Request req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ApiRouter& router_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void send_response(Response&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    beast::tcp_stream& lowest_layer();
};

}
