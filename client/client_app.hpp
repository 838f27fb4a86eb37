#pragma once

// ============================================================
// client_app.hpp -- gelfship CLI: ships stdin lines to a GELF
//   UDP endpoint through a pool of concurrent writers
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "gelf_client.hpp"
#include <string>
#include <atomic>
#include <memory>
#include <istream>

struct AppOptions {
    std::string  host;
    u16          port = 12201;
    int          level = gzip::DEFAULT_COMPRESSION;
    int          workers = 4;
    PoolStrategy strategy = PoolStrategy::POOLED;
    bool         self_log = false;   // also ship our own log lines
};

class ClientApp {
public:
    // Resolves the endpoint and builds the client; throws on bad options.
    explicit ClientApp(const AppOptions& opts);
    ~ClientApp();

    // Send every line of `in`, then print a summary.
    // Returns 0 when every line was sent, 1 otherwise.
    int run(std::istream& in);

    // Signal stop from a signal handler
    void stop();

private:
    AppOptions                  opts_;
    std::shared_ptr<UdpSocket>  sock_;
    std::unique_ptr<GelfClient> client_;
    std::atomic<bool>           stop_{false};
};
