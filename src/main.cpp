#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "clock.hpp"
#include "api_router.hpp"
#include "http_session.hpp"
#include "connection_tracker.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "tls_context.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace passgen {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ApiRouter& router,
        ConnectionTracker& connections
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , router_(router)
        , connections_(connections)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ApiRouter& router_;
    ConnectionTracker& connections_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;  // acceptor closed during shutdown
        }

        if (ec) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::CONNECTION_REJECTED,
                             "internal", "Accept error: " + ec.message());
        } else if (!connections_.try_acquire(config_.max_connections)) {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CONNECTION_REJECTED,
                             ep_ec ? "unknown" : ep.address().to_string(), "Global connection limit reached");
            MetricsRegistry::instance().increment_counter(metric::CONNECTIONS_REJECTED);
            // Socket is closed when it goes out of scope here
        } else {
            // Releases the slot once the session and all its pending handlers are gone
            auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this()](void*) {
                self_ref->connections_.release();
            });

            if (config_.enable_tls) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(
                    beast::tcp_stream(std::move(socket)),
                    ssl_ctx_
                );
                std::make_shared<HttpSession>(std::move(stream), config_, router_, guard)->run();
            } else {
                std::make_shared<HttpSession>(beast::tcp_stream(std::move(socket)), config_, router_, guard)->run();
            }
        }

        do_accept();
    }
};

}

int main(int argc, char* argv[]) {
    using passgen::EventLogger;
    try {
        passgen::ServerConfig config;

        // --- CLI Argument Parsing ---
        auto cli = passgen::apply_cli_args(config, argc, argv);
        if (cli.should_exit) {
            std::cout << passgen::usage(argv[0]);
            return cli.exit_code;
        }

        // --- Environment Variable Overrides ---
        passgen::apply_env_overrides(config);
        config.validate();

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls) {
            std::filesystem::path exe_path;
            try {
                exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
            } catch (const std::exception& e) {
                std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
                exe_path = std::filesystem::current_path();
            }

            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set PASSGEN_CERT / PASSGEN_KEY, or run without --tls.\n";
                return 1;
            }
        }

        std::cout << config.service_name << " v" << config.service_version << "\n"
                  << "  listening on " << config.address << ":" << config.port
                  << (config.enable_tls ? " (TLS " + config.tls_min_version + "+)" : std::string(" (plaintext)")) << "\n"
                  << "  worker threads: " << config.thread_count << "\n"
                  << "  NOTE: passwords are derived from phrase + current time and are predictable.\n"
                  << "        Do not use them as real secrets.\n\n";

        // Everything sessions reference is declared before the io_context so that pending
        // handlers destroyed with it never outlive their targets.
        passgen::SystemClock clock;
        passgen::ApiRouter router(config, clock);
        passgen::ConnectionTracker connections;

        ssl::context ssl_ctx{ssl::context::tls_server};
        if (config.enable_tls) {
            passgen::load_server_certificate(ssl_ctx, config);
        }

        net::io_context ioc{config.thread_count};

        auto listener = std::make_shared<passgen::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            router,
            connections
        );
        listener->run();

        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal", "Server started");

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal", "Server stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
