// ============================================================
// client/main.cpp -- gelfship entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/compress.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <host> <port> [options]\n"
        << "\n"
        << "  host            Graylog GELF UDP input (name or IP)\n"
        << "  port            UDP port (e.g. 12201)\n"
        << "\nReads newline-terminated messages from stdin and sends each\n"
        << "one as a gzip-compressed, chunked GELF datagram sequence.\n"
        << "\nOptions:\n"
        << "  --level N       gzip level: -1 default, 0 none, 1..9 (default: -1)\n"
        << "  --workers N     concurrent writers (default: 4)\n"
        << "  --shared        one shared encoder behind a lock instead of a pool\n"
        << "  --self-log      also ship gelfship's own log lines\n"
        << "  --log-file P    append log lines to file P\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  tail -F app.json | " << prog << " graylog.local 12201\n"
        << "  " << prog << " 10.0.0.5 12201 --level 9 --workers 8 < events.json\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    AppOptions opts;
    opts.host = argv[1];
    int port_int = 0;
    if (!utils::parse_int(argv[2], port_int) || !utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << argv[2] << "\n";
        return 1;
    }
    opts.port = (u16)port_int;

    Logger::get().set_level(LogLevel::INFO);

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
            if (!utils::parse_int(argv[++i], opts.level) || !gzip::valid_level(opts.level)) {
                std::cerr << "ERROR: Invalid compression level: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            if (!utils::parse_int(argv[++i], opts.workers) || opts.workers < 1) {
                std::cerr << "ERROR: Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--shared") == 0) {
            opts.strategy = PoolStrategy::SHARED;
        } else if (std::strcmp(argv[i], "--self-log") == 0) {
            opts.self_log = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_host(opts.host)) {
        std::cerr << "ERROR: Invalid host: " << opts.host << "\n";
        return 1;
    }

    try {
        ClientApp app(opts);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run(std::cin);
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
