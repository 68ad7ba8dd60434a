#include "client/console_frontend.hpp"
#include "client/session.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace peerdrop;

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "peerdrop.json";

void print_usage(const char* program) {
    std::cout << "PeerDrop - peer-to-peer file drop over a presence relay\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     Config file (default: ./" << DEFAULT_CONFIG_FILE << " if present)\n"
              << "  -u, --url <url>         Relay URL, ws:// or wss:// (overrides config)\n"
              << "  -b, --bind <address>    Transfer listener address\n"
              << "  -p, --port <port>       Transfer listener port (0 = any)\n"
              << "  -d, --download <dir>    Directory for received files\n"
              << "  -n, --nickname <name>   Display name (default: generated)\n"
              << "  -l, --log-level <l>     Log level: trace/debug/info/warn/error/off\n"
              << "  -h, --help              Show help\n\n"
              << "Once connected, type 'help' for the interactive commands.\n"
              << std::endl;
}

void setup_logging(const PeerDropConfig& config) {
    log::LogConfig log_config;
    log_config.level = log::parse_level(config.log_level).value_or(log::Level::Info);
    log_config.file_path = config.log_file;
    log::apply_env(log_config);
    log::init(log_config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string relay_url;
    std::string bind_address;
    std::string port;
    std::string download_dir;
    std::string nickname;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            relay_url = argv[++i];
        }
        else if ((arg == "-b" || arg == "--bind") && i + 1 < argc) {
            bind_address = argv[++i];
        }
        else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
        }
        else if ((arg == "-d" || arg == "--download") && i + 1 < argc) {
            download_dir = argv[++i];
        }
        else if ((arg == "-n" || arg == "--nickname") && i + 1 < argc) {
            nickname = argv[++i];
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load config
    PeerDropConfig config;
    if (config_file.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(DEFAULT_CONFIG_FILE, ec)) {
            config_file = DEFAULT_CONFIG_FILE;
        }
    }
    if (!config_file.empty()) {
        auto loaded = PeerDropConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: " << config_error_message(loaded.error()) << ": " << config_file << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    // Override with command line
    if (!relay_url.empty()) config.relay.url = relay_url;
    if (!bind_address.empty()) config.transfer.bind_address = bind_address;
    if (!port.empty()) {
        char* end = nullptr;
        unsigned long value = std::strtoul(port.c_str(), &end, 10);
        if (end == port.c_str() || *end != '\0' || value > 0xFFFF) {
            std::cerr << "Invalid port: " << port << "\n";
            return 1;
        }
        config.transfer.port = static_cast<uint16_t>(value);
    }
    if (!download_dir.empty()) config.transfer.download_dir = download_dir;
    if (!nickname.empty()) config.session.nickname = nickname;
    if (!log_level.empty()) config.log_level = log_level;

    if (auto valid = config.validate(); !valid) {
        std::cerr << "Error: " << config_error_message(valid.error()) << "\n";
        return 1;
    }

    setup_logging(config);

    if (!crypto::init()) {
        LOG_ERROR("Failed to initialize libsodium");
        return 1;
    }

    net::io_context ioc;

    ConsoleFrontend frontend(std::cout);
    Session session(ioc.get_executor(), config, SessionConnectors::defaults(config), frontend.callbacks());
    frontend.attach(session);

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        LOG_INFO("Received signal {}, shutting down...", sig);
        session.shutdown();
    });

    net::co_spawn(ioc, session.run(), [&](std::exception_ptr ep) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("Session loop exception: {}", e.what());
            }
        }
        signals.cancel();
    });

    session.start();
    frontend.print_help();

    // Blocking stdin reader; each line is handled on the io_context thread.
    // Detached because getline() cannot be interrupted once the session ends.
    auto bridge = std::make_shared<InputBridge>(ioc);
    std::thread input([bridge, &frontend, &session]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            bool posted = bridge->post([&frontend, &session, line]() {
                if (!frontend.execute(line)) {
                    session.shutdown();
                }
            });
            if (!posted || line == "quit" || line == "exit") {
                return;
            }
        }
        bridge->post([&session]() { session.shutdown(); });
    });
    input.detach();

    ioc.run();
    bridge->close();

    LOG_INFO("PeerDrop exiting");
    log::shutdown();
    return 0;
}
