// ============================================================
// client_app.cpp -- gelfship CLI: read stdin, write GELF
// ============================================================

#include "client_app.hpp"
#include "writer_pool.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <deque>
#include <future>
#include <exception>
#include <string>

// Futures kept in flight per worker before we start collecting results
static constexpr size_t INFLIGHT_PER_WORKER = 8;

ClientApp::ClientApp(const AppOptions& opts)
    : opts_(opts)
{
    ClientConfig cfg;
    cfg.server_addr       = SockAddr::resolve(opts_.host, opts_.port);
    cfg.compression_level = opts_.level;
    cfg.strategy          = opts_.strategy;

    sock_ = std::make_shared<UdpSocket>(cfg.server_addr.family());
    sock_->tune();
    cfg.conn = sock_;

    client_ = std::make_unique<GelfClient>(cfg);

    LOG_INFO("ClientApp: server=" + cfg.server_addr.to_string() +
             " level=" + std::to_string(opts_.level) +
             " workers=" + std::to_string(opts_.workers) +
             " strategy=" + pool_strategy_str(opts_.strategy));
}

ClientApp::~ClientApp() {
    Logger::get().set_sink(nullptr);
    stop();
}

void ClientApp::stop() {
    stop_.store(true);
}

int ClientApp::run(std::istream& in) {
    if (opts_.self_log) {
        Logger::get().set_sink(client_.get());
    }

    u64 lines = 0, failed = 0, input_bytes = 0;
    u64 start_ms = utils::now_ms();

    auto collect = [&](std::future<size_t>& f) {
        try {
            input_bytes += f.get();
        } catch (const GelfError& e) {
            ++failed;
            LOG_WARN(std::string("write failed [") + error_kind_str(e.kind()) + "]: " + e.what());
        } catch (const std::exception& e) {
            ++failed;
            LOG_WARN(std::string("write failed: ") + e.what());
        }
    };

    {
        WriterPool pool((size_t)opts_.workers, *client_);
        std::deque<std::future<size_t>> inflight;
        const size_t window = (size_t)opts_.workers * INFLIGHT_PER_WORKER;

        std::string line;
        while (!stop_.load() && std::getline(in, line)) {
            line += '\n';
            inflight.push_back(pool.submit(line.data(), line.size()));
            ++lines;
            while (inflight.size() >= window) {
                collect(inflight.front());
                inflight.pop_front();
            }
        }
        for (auto& f : inflight) collect(f);
        pool.close();
    }

    Logger::get().set_sink(nullptr);

    u64 elapsed = utils::now_ms() - start_ms;
    LOG_INFO("Done: lines=" + std::to_string(lines) +
             " failed=" + std::to_string(failed) +
             " input=" + utils::format_bytes(input_bytes) +
             " messages=" + std::to_string(client_->messages_sent()) +
             " chunks=" + std::to_string(client_->chunks_sent()) +
             " wire=" + utils::format_bytes(client_->bytes_sent()) +
             " encoders=" + std::to_string(client_->pool().created()) +
             " time=" + std::to_string(elapsed) + "ms");

    return failed == 0 ? 0 : 1;
}
