#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ai_gateway.hpp"
#include "chat_hub.hpp"
#include "listener.hpp"
#include "logger.hpp"
#include "server_config.hpp"

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Client-side TLS for the completion API: system trust store, peer verification on.
static void configure_client_tls(ssl::context& ctx) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
}

int main(int argc, char* argv[]) {
    using chathub::Logger;
    try {
        chathub::ServerConfig config;

        // --- CLI Argument Parsing ---
        bool port_from_cli = false;
        uint16_t cli_port = 0;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port]\n"
                          << "Options:\n"
                          << "  --help, -h     Show this help\n"
                          << "Environment:\n"
                          << "  WS_PORT, WS_ADDR, WS_THREADS, TRUST_PROXY_HEADERS,\n"
                          << "  RATE_LIMIT_ENABLED, RATE_LIMIT_MSG_PER_MIN,\n"
                          << "  AI_ENABLED, OPENROUTER_API_KEY, AI_MODEL, AI_API_URL,\n"
                          << "  AI_RATE_LIMIT, AI_TIMEOUT_SECS, AI_MAX_TOKENS, LOG_LEVEL\n";
                return 0;
            }
            try {
                int value = std::stoi(arg);
                if (value < 0 || value > 65535) {
                    throw std::out_of_range(arg);
                }
                cli_port = static_cast<uint16_t>(value);
                port_from_cli = true;
            } catch (const std::exception&) {
                std::cerr << "[!] Invalid port: " << arg << "\n";
                return 1;
            }
        }

        // --- Environment Variable Overrides ---
        chathub::apply_env_overrides(config);
        if (port_from_cli) {
            config.port = cli_port;
        }

        Logger::set_level(Logger::parse_level(config.log_level));

        if (config.ai.enabled && config.ai.api_key.empty()) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::LIFECYCLE, "internal",
                        "AI_ENABLED is set but OPENROUTER_API_KEY is missing; ai command disabled");
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        std::cout << "chathub v" << CHATHUB_VERSION << " listening on "
                  << config.address << ":" << config.port
                  << " (" << config.thread_count << " threads, ai "
                  << (config.ai.is_available() ? "enabled" : "disabled") << ")\n";

        net::io_context ioc{config.thread_count};

        ssl::context tls_client{ssl::context::tls_client};
        configure_client_tls(tls_client);

        chathub::AiGateway ai(ioc.get_executor(), tls_client, config.ai);
        chathub::ChatHub hub(config, ai);

        auto listener = std::make_shared<chathub::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            hub
        );
        listener->run();

        Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "internal",
                    "Server started on port " + std::to_string(listener->local_port()));

        // Stop accepting, then let every send loop flush and close. The io_context
        // runs out of work once the last session is gone.
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&hub, listener](beast::error_code const& ec, int) {
                if (ec) return;
                Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "internal",
                            "Initiating graceful shutdown");
                listener->stop();
                hub.close_all();
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

        Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "internal", "Server stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
