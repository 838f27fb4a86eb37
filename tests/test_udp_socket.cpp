#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/test_check.hpp"
#include "common/gelf_reassembly.hpp"
#include "../common/socket.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../client/gelf_client.hpp"

void test_sockaddr() {
    std::cout << "[TEST] SockAddr parsing and formatting\n";

    SockAddr v4 = SockAddr::from_ip("127.0.0.1", 12201);
    TEST_CHECK(v4.valid());
    TEST_CHECK(v4.family() == AF_INET);
    TEST_CHECK(v4.port() == 12201);
    TEST_CHECK(v4.to_string() == "127.0.0.1:12201");

    SockAddr v6 = SockAddr::from_ip("::1", 514);
    TEST_CHECK(v6.family() == AF_INET6);
    TEST_CHECK(v6.to_string() == "[::1]:514");
    TEST_CHECK(v4 != v6);

    TEST_CHECK(SockAddr::resolve("127.0.0.1", 12201) == v4);

    SockAddr unset;
    TEST_CHECK(!unset.valid());
    TEST_CHECK(unset.to_string() == "unset");

    TEST_THROWS(SockAddr::from_ip("not-an-ip", 1), std::runtime_error);
}

void test_loopback_datagram() {
    std::cout << "[TEST] UdpSocket loopback send/recv\n";

    UdpSocket rx(AF_INET);
    rx.bind("127.0.0.1", 0);
    rx.set_recv_timeout_ms(2000);
    SockAddr dest = rx.local_addr();
    TEST_CHECK(dest.port() != 0);

    UdpSocket tx(AF_INET);
    tx.tune();
    const std::string msg = "datagram";
    tx.write_to(msg.data(), msg.size(), dest);

    std::vector<u8> buf;
    SockAddr from;
    TEST_CHECK(rx.recv_from(buf, &from));
    TEST_CHECK(std::string(buf.begin(), buf.end()) == msg);
    TEST_CHECK(from.valid());

    TEST_THROWS(tx.write_to(msg.data(), msg.size(), SockAddr()), std::runtime_error);
}

void test_recv_timeout() {
    std::cout << "[TEST] UdpSocket recv_from returns false on timeout\n";

    UdpSocket rx(AF_INET);
    rx.bind("127.0.0.1", 0);
    rx.set_recv_timeout_ms(50);
    std::vector<u8> buf;
    TEST_CHECK(!rx.recv_from(buf));
    TEST_CHECK(buf.empty());
}

void test_construct_by_family() {
    std::cout << "[TEST] UdpSocket opens a datagram socket per address family\n";

    UdpSocket def;
    TEST_CHECK(def.is_valid());

    UdpSocket v4(AF_INET);
    TEST_CHECK(v4.is_valid());
    TEST_CHECK(v4.native() != def.native());
}

void test_move() {
    std::cout << "[TEST] UdpSocket move transfers the descriptor\n";

    UdpSocket a(AF_INET);
    socket_t fd = a.native();
    UdpSocket b(std::move(a));
    TEST_CHECK(!a.is_valid());
    TEST_CHECK(b.is_valid() && b.native() == fd);
    b.close();
    TEST_CHECK(!b.is_valid());
}

void test_gelf_over_loopback() {
    std::cout << "[TEST] GelfClient over a real UDP socket\n";

    UdpSocket rx(AF_INET);
    rx.bind("127.0.0.1", 0);
    rx.set_recv_timeout_ms(2000);

    ClientConfig cfg;
    cfg.server_addr       = rx.local_addr();
    cfg.conn              = std::make_shared<UdpSocket>(AF_INET);
    cfg.compression_level = gzip::NO_COMPRESSION;
    GelfClient client(cfg);

    std::string body;
    for (int i = 0; i < 5000; ++i) body += (char)('A' + (i * 17) % 26);
    TEST_CHECK(client.write(body + "\n") == body.size());

    u64 expected = client.chunks_sent();
    TEST_CHECK(expected >= 4);

    std::vector<std::vector<u8>> received;
    std::vector<u8> buf;
    while (received.size() < expected && rx.recv_from(buf)) {
        TEST_CHECK(buf.size() <= GELF_MTU_SIZE);
        received.push_back(buf);
    }
    TEST_CHECK(received.size() == expected);

    auto msgs = reassemble(received);
    TEST_CHECK(msgs.size() == 1);
    TEST_CHECK(msgs.begin()->second.text == body);
}

int main() {
    platform::Guard guard;
    Logger::get().set_level(LogLevel::WARN);

    test_sockaddr();
    test_loopback_datagram();
    test_recv_timeout();
    test_construct_by_family();
    test_move();
    test_gelf_over_loopback();

    std::cout << "[TEST] ALL UDP SOCKET TESTS PASSED\n";
    return 0;
}
