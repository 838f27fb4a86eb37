#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/test_check.hpp"
#include "common/mock_packet_conn.hpp"
#include "common/gelf_reassembly.hpp"
#include "../client/writer_pool.hpp"
#include "../client/gelf_streambuf.hpp"
#include "../client/gelf_client.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/json.hpp"

// Records every write; throws for lines starting with "fail"
class RecordingWriter : public Writer {
public:
    using Writer::write;

    size_t write(const void* data, size_t len) override {
        std::string s(static_cast<const char*>(data), len);
        if (s.compare(0, 4, "fail") == 0) {
            throw std::runtime_error("rejected: " + s);
        }
        std::lock_guard<std::mutex> lk(mutex_);
        lines_.push_back(s);
        return len;
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lk(mutex_);
        return lines_;
    }

private:
    std::mutex               mutex_;
    std::vector<std::string> lines_;
};

void test_pool_results() {
    std::cout << "[TEST] WriterPool returns each write's result through its future\n";

    RecordingWriter target;
    WriterPool pool(4, target);
    TEST_CHECK(pool.size() == 4);

    std::vector<std::future<size_t>> futures;
    for (int i = 0; i < 100; ++i) {
        std::string line = "line " + std::to_string(i) + "\n";
        futures.push_back(pool.submit(line.data(), line.size()));
    }
    for (int i = 0; i < 100; ++i) {
        TEST_CHECK(futures[i].get() == ("line " + std::to_string(i) + "\n").size());
    }
    TEST_CHECK(target.lines().size() == 100);

    TEST_CHECK(pool.write(std::string_view("blocking\n")) == 9);
}

void test_pool_exception_propagates() {
    std::cout << "[TEST] WriterPool carries target exceptions to the caller\n";

    RecordingWriter target;
    WriterPool pool(2, target);

    std::future<size_t> bad = pool.submit("fail now\n", 9);
    std::future<size_t> good = pool.submit("fine\n", 5);
    TEST_THROWS(bad.get(), std::runtime_error);
    TEST_CHECK(good.get() == 5);

    // Worker survived the failure
    TEST_CHECK(pool.write(std::string_view("again\n")) == 6);
}

void test_pool_close() {
    std::cout << "[TEST] WriterPool drains on close and refuses later work\n";

    RecordingWriter target;
    WriterPool pool(3, target);
    std::vector<std::future<size_t>> futures;
    for (int i = 0; i < 30; ++i) futures.push_back(pool.submit("q\n", 2));
    pool.close();
    pool.close();

    for (auto& f : futures) TEST_CHECK(f.get() == 2);
    TEST_CHECK(target.lines().size() == 30);
    TEST_THROWS(pool.submit("late\n", 5), std::runtime_error);
}

void test_pool_into_gelf_client() {
    std::cout << "[TEST] WriterPool fanning into a GelfClient\n";

    auto conn = std::make_shared<MockPacketConn>();
    ClientConfig cfg;
    cfg.server_addr = SockAddr::from_ip("127.0.0.1", 12201);
    cfg.conn        = conn;
    GelfClient client(cfg);

    {
        WriterPool pool(4, client);
        std::vector<std::future<size_t>> futures;
        for (int i = 0; i < 50; ++i) {
            std::string line = "{\"n\":" + std::to_string(i) + "}\n";
            futures.push_back(pool.submit(line.data(), line.size()));
        }
        std::future<size_t> bad = pool.submit("no newline", 10);
        for (int i = 0; i < 50; ++i) {
            TEST_CHECK(futures[i].get() == ("{\"n\":" + std::to_string(i) + "}\n").size());
        }
        TEST_THROWS(bad.get(), MissingNewlineError);

        // The client trims; the pool still reports everything it was given
        const std::string padded = "  {\"padded\":true} \t\n";
        TEST_CHECK(pool.write(std::string_view(padded)) == padded.size());
        TEST_CHECK(client.write(padded) == padded.size() - 5);
    }

    auto msgs = reassemble(datagram_bytes(conn->sent()));
    TEST_CHECK(msgs.size() == 52);
    TEST_CHECK(client.messages_sent() == 52);
}

void test_streambuf_lines() {
    std::cout << "[TEST] GelfStreamBuf emits one write per line\n";

    RecordingWriter target;
    {
        GelfStreamBuf sb(target);
        std::ostream os(&sb);
        os << "first " << 1 << "\n" << "second\nthird";
        TEST_CHECK(os.good());
        TEST_CHECK(sb.pending() == 5);
        os << " part" << std::endl;
        TEST_CHECK(sb.pending() == 0);
        os << "tail";
    }
    // The destructor sends the unterminated tail with a newline
    std::vector<std::string> lines = target.lines();
    TEST_CHECK(lines.size() == 4);
    TEST_CHECK(lines[0] == "first 1\n");
    TEST_CHECK(lines[1] == "second\n");
    TEST_CHECK(lines[2] == "third part\n");
    TEST_CHECK(lines[3] == "tail\n");
}

void test_streambuf_failure() {
    std::cout << "[TEST] GelfStreamBuf sets badbit on a failed write\n";

    RecordingWriter target;
    GelfStreamBuf sb(target);
    std::ostream os(&sb);

    os << "fail this line\n";
    TEST_CHECK(os.bad());
    TEST_CHECK(sb.last_error() != nullptr);
    TEST_THROWS(std::rethrow_exception(sb.last_error()), std::runtime_error);

    os.clear();
    os << "ok\n";
    TEST_CHECK(os.good());
    TEST_CHECK(target.lines().size() == 1);
    TEST_CHECK(target.lines()[0] == "ok\n");
}

void test_logger_sink() {
    std::cout << "[TEST] Logger forwards lines to a GelfClient sink\n";

    auto conn = std::make_shared<MockPacketConn>();
    ClientConfig cfg;
    cfg.server_addr = SockAddr::from_ip("127.0.0.1", 12201);
    cfg.conn        = conn;
    GelfClient client(cfg);

    Logger::get().set_host("test-host");
    Logger::get().set_sink(&client);
    LOG_WARN("disk \"sda\" almost full");
    LOG_DEBUG("below threshold, not forwarded");
    Logger::get().set_sink(nullptr);
    LOG_WARN("after detach");

    auto msgs = reassemble(datagram_bytes(conn->sent()));
    TEST_CHECK(msgs.size() == 1);
    const std::string& text = msgs.begin()->second.text;
    TEST_CHECK(text.find("{\"version\":\"1.1\",\"host\":\"test-host\",") == 0);
    TEST_CHECK(text.find("\"short_message\":\"disk \\\"sda\\\" almost full\"") != std::string::npos);
    TEST_CHECK(text.find("\"timestamp\":") != std::string::npos);
    TEST_CHECK(text.find("\"level\":4}") != std::string::npos);
    // Trailing newline was trimmed before compression
    TEST_CHECK(text.back() == '}');
}

void test_json_escape() {
    std::cout << "[TEST] JSON escaping of log messages\n";

    TEST_CHECK(json::escape("plain") == "plain");
    TEST_CHECK(json::escape("a\"b\\c") == "a\\\"b\\\\c");
    TEST_CHECK(json::escape("l1\nl2\t") == "l1\\nl2\\t");
    TEST_CHECK(json::escape(std::string("\x01", 1)) == "\\u0001");
    TEST_CHECK(json::escape("caf\xC3\xA9") == "caf\xC3\xA9");
}

void test_logger_sink_failure() {
    std::cout << "[TEST] Logger survives a failing sink\n";

    auto conn = std::make_shared<MockPacketConn>();
    conn->fail_at(0);
    ClientConfig cfg;
    cfg.server_addr = SockAddr::from_ip("127.0.0.1", 12201);
    cfg.conn        = conn;
    GelfClient client(cfg);

    Logger::get().set_sink(&client);
    LOG_WARN("unsendable");
    Logger::get().set_sink(nullptr);
    TEST_CHECK(conn->calls() == 1);
    TEST_CHECK(conn->sent_count() == 0);
}

// Forwards to a GelfClient and logs about it, as a client does when an
// encoder fails to reset on release
class ChattySink : public Writer {
public:
    using Writer::write;

    explicit ChattySink(Writer& next) : next_(next) {}

    size_t write(const void* data, size_t len) override {
        ++calls_;
        LOG_WARN("sink forwarding " + std::to_string(len) + " bytes");
        return next_.write(data, len);
    }

    int calls() const { return calls_; }

private:
    Writer& next_;
    int     calls_ = 0;
};

void test_logger_sink_logs_from_write() {
    std::cout << "[TEST] Logger tolerates a sink that logs from inside write()\n";

    auto conn = std::make_shared<MockPacketConn>();
    ClientConfig cfg;
    cfg.server_addr = SockAddr::from_ip("127.0.0.1", 12201);
    cfg.conn        = conn;
    GelfClient client(cfg);
    ChattySink sink(client);

    Logger::get().set_sink(&sink);
    LOG_WARN("outer event");
    LOG_ERROR("second event");
    Logger::get().set_sink(nullptr);

    // Nested events stay local; only the two outer ones are shipped
    TEST_CHECK(sink.calls() == 2);
    auto msgs = reassemble(datagram_bytes(conn->sent()));
    TEST_CHECK(msgs.size() == 2);
    for (auto& kv : msgs) {
        TEST_CHECK(kv.second.text.find("sink forwarding") == std::string::npos);
    }
}

int main() {
    Logger::get().set_level(LogLevel::WARN);

    test_pool_results();
    test_pool_exception_propagates();
    test_pool_close();
    test_pool_into_gelf_client();
    test_streambuf_lines();
    test_streambuf_failure();
    test_json_escape();
    test_logger_sink();
    test_logger_sink_failure();
    test_logger_sink_logs_from_write();

    std::cout << "[TEST] ALL WRITER POOL TESTS PASSED\n";
    return 0;
}
