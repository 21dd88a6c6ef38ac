#include <catch2/catch.hpp>
#include <scrpc/net/timed_socket.hpp>

#include <arpa/inet.h>

#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../test_main.cpp"  // For scaled timeouts and socket pairs

using namespace scrpc::net;
using namespace scrpc::test;
using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    return data;
}

// Write raw bytes, bypassing the framing layer
void send_raw(timed_socket& sock, const void* data, size_t size) {
    const auto* p = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < size) {
        sent += sock.send(p + sent, size - sent);
    }
}

void send_prefix(timed_socket& sock, uint32_t length, size_t bytes = frame_prefix_size) {
    uint32_t be = htonl(length);
    send_raw(sock, &be, bytes);
}

using clock_type = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(clock_type::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - start);
}

} // namespace

// ============================================================================
// Addresses
// ============================================================================

TEST_CASE("ipv4_address parsing", "[net][address]") {
    ipv4_address any(8080);
    REQUIRE(any.to_string() == "0.0.0.0:8080");

    ipv4_address loopback("127.0.0.1", 9000);
    REQUIRE(loopback.to_string() == "127.0.0.1:9000");

    auto resolved = ipv4_address::resolve("", 1);
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->addr == INADDR_ANY);

    REQUIRE(ipv4_address("localhost", 1).to_string() == "127.0.0.1:1");
}

// ============================================================================
// Connection setup
// ============================================================================

TEST_CASE("Bind to port 0 reports the real port", "[net][socket]") {
    auto listener = make_listener();
    REQUIRE(listener.is_valid());
    REQUIRE(listener.local_address().port != 0);
}

TEST_CASE("Connect to a closed port fails", "[net][socket]") {
    uint16_t port;
    {
        auto listener = make_listener();
        port = listener.local_address().port;
    }

    timed_socket client;
    REQUIRE_THROWS_AS(client.connect(ipv4_address("127.0.0.1", port), scaled_ms(2000)),
                      connection_error);
}

TEST_CASE("Accepted sockets know their peer", "[net][socket]") {
    auto [client, server] = make_socket_pair();
    REQUIRE(server.peer_address().addr == htonl(INADDR_LOOPBACK));
    REQUIRE(client.peer_address().port != 0);
}

TEST_CASE("Close is idempotent", "[net][socket]") {
    auto [client, server] = make_socket_pair();
    client.close();
    client.close();
    REQUIRE_FALSE(client.is_valid());

    uint8_t byte = 0;
    REQUIRE_THROWS_AS(client.send(&byte, 1), socket_error);
}

TEST_CASE("Negative timeouts are rejected", "[net][socket]") {
    auto [client, server] = make_socket_pair();
    uint8_t byte = 0;
    REQUIRE_THROWS_AS(client.recv(&byte, 1, std::chrono::milliseconds(-1)), std::invalid_argument);
    REQUIRE_THROWS_AS(client.send(&byte, 1, std::chrono::milliseconds(-5)), std::invalid_argument);
}

// ============================================================================
// Timeouts
// ============================================================================

TEST_CASE("accept times out", "[net][timeout]") {
    auto listener = make_listener();
    auto timeout = scaled_ms(100);

    auto start = clock_type::now();
    REQUIRE_THROWS_AS(listener.accept(timeout), timeout_error);
    auto elapsed = elapsed_since(start);

    REQUIRE(elapsed >= timeout - 5ms);
    REQUIRE(elapsed < timeout + scaled_ms(1000));
}

TEST_CASE("recv times out", "[net][timeout]") {
    auto [client, server] = make_socket_pair();
    auto timeout = scaled_ms(100);
    uint8_t buffer[16];

    auto start = clock_type::now();
    REQUIRE_THROWS_AS(server.recv(buffer, sizeof(buffer), timeout), timeout_error);
    auto elapsed = elapsed_since(start);

    REQUIRE(elapsed >= timeout - 5ms);
    REQUIRE(elapsed < timeout + scaled_ms(1000));

    // The socket remains usable after a timeout
    const char msg[] = "ok";
    send_raw(client, msg, 2);
    REQUIRE(server.recv(buffer, sizeof(buffer), scaled_ms(1000)) == 2);
}

TEST_CASE("recv_framed times out waiting for a prefix", "[net][timeout]") {
    auto [client, server] = make_socket_pair();
    REQUIRE_THROWS_AS(server.recv_framed(scaled_ms(50)), timeout_error);
}

TEST_CASE("send times out when the peer stops reading", "[net][timeout]") {
    auto [client, server] = make_socket_pair();
    auto chunk = pattern(64 * 1024);

    bool filled = false;
    for (int i = 0; i < 100000 && !filled; ++i) {
        try {
            client.send(chunk.data(), chunk.size(), scaled_ms(50));
        } catch (const timeout_error&) {
            filled = true;
        }
    }
    REQUIRE(filled);

    auto timeout = scaled_ms(100);
    auto start = clock_type::now();
    REQUIRE_THROWS_AS(client.send(chunk.data(), chunk.size(), timeout), timeout_error);
    auto elapsed = elapsed_since(start);
    REQUIRE(elapsed >= timeout - 5ms);
    REQUIRE(elapsed < timeout + scaled_ms(1000));
}

// ============================================================================
// Framing
// ============================================================================

TEST_CASE("Framed messages round trip", "[net][framing]") {
    auto [client, server] = make_socket_pair();

    SECTION("empty payload") {
        client.send_framed(std::string_view(""));
        auto msg = server.recv_framed(scaled_ms(1000));
        REQUIRE(msg.has_value());
        REQUIRE(msg->empty());
    }

    SECTION("small payload") {
        client.send_framed(std::string_view("PERFORM add"));
        auto msg = server.recv_framed(scaled_ms(1000));
        REQUIRE(msg.has_value());
        REQUIRE(std::string(msg->begin(), msg->end()) == "PERFORM add");
    }

    SECTION("payload larger than 64 KiB") {
        auto data = pattern(200 * 1024 + 3);
        std::thread sender([&client = client, &data] {
            client.send_framed(data);
        });
        auto msg = server.recv_framed(scaled_ms(2000));
        sender.join();
        REQUIRE(msg.has_value());
        REQUIRE(*msg == data);
    }

    SECTION("messages keep their boundaries") {
        client.send_framed(std::string_view("one"));
        client.send_framed(std::string_view("two"));
        auto first = server.recv_framed(scaled_ms(1000));
        auto second = server.recv_framed(scaled_ms(1000));
        REQUIRE(std::string(first->begin(), first->end()) == "one");
        REQUIRE(std::string(second->begin(), second->end()) == "two");
    }
}

TEST_CASE("Framed messages survive tiny chunk sizes", "[net][framing]") {
    transport_options opts;
    opts.chunk_size = 7;
    auto [client, server] = make_socket_pair(opts);

    auto data = pattern(1000);
    client.send_framed(data);
    auto msg = server.recv_framed(scaled_ms(1000));
    REQUIRE(msg.has_value());
    REQUIRE(*msg == data);
}

TEST_CASE("Peer close before a frame reads as empty", "[net][framing]") {
    auto [client, server] = make_socket_pair();
    client.close();
    auto msg = server.recv_framed(scaled_ms(1000));
    REQUIRE_FALSE(msg.has_value());
}

TEST_CASE("Truncated length prefix is fatal", "[net][framing]") {
    transport_options opts;
    opts.framed_chunk_timeout = scaled_ms(100);
    auto [client, server] = make_socket_pair(opts);

    SECTION("peer closes mid-prefix") {
        send_prefix(client, 10, 2);
        client.close();
        REQUIRE_THROWS_AS(server.recv_framed(scaled_ms(1000)), framing_error);
    }

    SECTION("prefix stalls") {
        send_prefix(client, 10, 3);
        REQUIRE_THROWS_AS(server.recv_framed(scaled_ms(1000)), framing_error);
    }
}

TEST_CASE("Stalled payload fails after consecutive timeouts", "[net][framing]") {
    transport_options opts;
    opts.framed_chunk_timeout = scaled_ms(100);
    opts.max_consecutive_timeouts = 2;
    auto [client, server] = make_socket_pair(opts);

    send_prefix(client, 100);
    auto part = pattern(10);
    send_raw(client, part.data(), part.size());

    auto start = clock_type::now();
    try {
        server.recv_framed(scaled_ms(1000));
        FAIL("expected framing_error");
    } catch (const framing_error& e) {
        REQUIRE(std::string(e.what()) == "not enough data was received");
    }
    // Two chunk timeouts, not one
    REQUIRE(elapsed_since(start) >= 2 * opts.framed_chunk_timeout - 10ms);
}

TEST_CASE("A single stalled chunk is tolerated", "[net][framing]") {
    transport_options opts;
    opts.framed_chunk_timeout = scaled_ms(200);
    opts.max_consecutive_timeouts = 2;
    auto [client, server] = make_socket_pair(opts);

    auto data = pattern(64);
    send_prefix(client, static_cast<uint32_t>(data.size()));
    send_raw(client, data.data(), 32);

    std::thread late_sender([&client = client, &data] {
        std::this_thread::sleep_for(scaled_ms(300));
        send_raw(client, data.data() + 32, 32);
    });

    auto msg = server.recv_framed(scaled_ms(1000));
    late_sender.join();
    REQUIRE(msg.has_value());
    REQUIRE(*msg == data);
}

TEST_CASE("Peer close mid-payload is fatal", "[net][framing]") {
    auto [client, server] = make_socket_pair();
    send_prefix(client, 100);
    auto part = pattern(10);
    send_raw(client, part.data(), part.size());
    client.close();

    try {
        server.recv_framed(scaled_ms(1000));
        FAIL("expected framing_error");
    } catch (const framing_error& e) {
        REQUIRE(std::string(e.what()) == "connection was closed unexpectedly");
    }
}

TEST_CASE("Frame size limit", "[net][framing]") {
    transport_options small;
    small.max_message_size = 16;

    SECTION("oversized send is refused before anything is written") {
        auto [client, server] = make_socket_pair(small);
        auto data = pattern(17);
        REQUIRE_THROWS_AS(client.send_framed(data), framing_error);
        REQUIRE_THROWS_AS(server.recv_framed(scaled_ms(50)), timeout_error);
    }

    SECTION("oversized declared length is refused on receive") {
        auto listener = make_listener(small);
        timed_socket client;
        client.connect(ipv4_address("127.0.0.1", listener.local_address().port), scaled_ms(2000));
        auto server = listener.accept(scaled_ms(2000));

        client.send_framed(pattern(32));
        REQUIRE_THROWS_AS(server.recv_framed(scaled_ms(1000)), framing_error);
    }
}
