// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Integration tests for SctpTransport over loopback

#include <catch2/catch_test_macros.hpp>

#include "infra/sctp_support.hpp"
#include "network/sctp_transport.hpp"

#include <asio/executor_work_guard.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

using namespace skiff::network;
using skiff::test::sctp_available;
using skiff::test::wait_until;

namespace {

// Helper to manage io_context + thread for tests
class TestIoContext {
public:
    TestIoContext()
        : io_context_(),
          work_guard_(asio::make_work_guard(io_context_)),
          thread_([this]() { io_context_.run(); }) {}

    ~TestIoContext() {
        work_guard_.reset();
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    asio::io_context& get() { return io_context_; }

private:
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread thread_;
};

// Restores the default send queue limit on scope exit
struct SendQueueLimitGuard {
    explicit SendQueueLimitGuard(size_t bytes) { SctpConnection::set_send_queue_limit_for_test(bytes); }
    ~SendQueueLimitGuard() { SctpConnection::set_send_queue_limit_for_test(0); }
};

ChannelBootstrap client_bootstrap(int timeout_ms = 2000) {
    ChannelBootstrap bootstrap(Role::Client);
    bootstrap.option(OptionEntry{options::CONNECT_TIMEOUT_MS.key(), timeout_ms});
    return bootstrap;
}

}  // namespace

TEST_CASE("SctpTransport: listen on an ephemeral port", "[network][transport][sctp]") {
    if (!sctp_available()) {
        WARN("Skipping: SCTP sockets are not available on this host");
        return;
    }

    TestIoContext acceptor;
    TestIoContext io;
    SctpTransport transport(acceptor.get(), io.get());

    REQUIRE(transport.listening_port() == 0);

    std::error_code ec = transport.listen("127.0.0.1", 0, ChannelBootstrap(Role::Server), [](TransportConnectionPtr) {});
    REQUIRE_FALSE(ec);
    REQUIRE(transport.listening_port() != 0);

    SECTION("Second listen on the same transport fails") {
        std::error_code again =
            transport.listen("127.0.0.1", transport.listening_port(), ChannelBootstrap(Role::Server), nullptr);
        REQUIRE(again);
    }

    SECTION("stop is idempotent") {
        transport.stop();
        transport.stop();
        REQUIRE(transport.listening_port() == 0);
    }

    transport.stop();
}

TEST_CASE("SctpTransport: port already in use", "[network][transport][sctp]") {
    if (!sctp_available()) {
        WARN("Skipping: SCTP sockets are not available on this host");
        return;
    }

    TestIoContext io;
    SctpTransport first(io.get(), io.get());
    SctpTransport second(io.get(), io.get());

    REQUIRE_FALSE(first.listen("127.0.0.1", 0, ChannelBootstrap(Role::Server), [](TransportConnectionPtr) {}));
    std::error_code ec =
        second.listen("127.0.0.1", first.listening_port(), ChannelBootstrap(Role::Server), [](TransportConnectionPtr) {});
    REQUIRE(ec);
    REQUIRE(second.listening_port() == 0);

    first.stop();
}

TEST_CASE("SctpTransport: echo roundtrip", "[network][transport][sctp]") {
    if (!sctp_available()) {
        WARN("Skipping: SCTP sockets are not available on this host");
        return;
    }

    TestIoContext acceptor;
    TestIoContext io;
    SctpTransport server(acceptor.get(), io.get());
    SctpTransport client(io.get(), io.get());

    std::mutex m;
    std::condition_variable cv;
    TransportConnectionPtr inbound;
    std::atomic<bool> inbound_closed{false};

    auto accept_cb = [&](TransportConnectionPtr c) {
        TransportConnection* raw = c.get();
        c->set_receive_callback([raw](const std::vector<uint8_t>& data) { (void)raw->send(data); });
        c->set_disconnect_callback([&inbound_closed]() { inbound_closed = true; });
        c->start();
        {
            std::lock_guard<std::mutex> lk(m);
            inbound = c;
        }
        cv.notify_all();
    };

    REQUIRE_FALSE(server.listen("127.0.0.1", 0, ChannelBootstrap(Role::Server), accept_cb));
    const uint16_t port = server.listening_port();

    std::error_code ec;
    TransportConnectionPtr conn = client.connect("127.0.0.1", port, client_bootstrap(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(conn);
    REQUIRE(conn->is_open());
    REQUIRE_FALSE(conn->is_inbound());
    REQUIRE(conn->remote_address() == "127.0.0.1");
    REQUIRE(conn->remote_port() == port);

    std::vector<uint8_t> received;
    conn->set_receive_callback([&](const std::vector<uint8_t>& data) {
        std::lock_guard<std::mutex> lk(m);
        received.insert(received.end(), data.begin(), data.end());
        cv.notify_all();
    });
    conn->start();

    {
        std::unique_lock<std::mutex> lk(m);
        REQUIRE(cv.wait_for(lk, std::chrono::seconds(5), [&] { return inbound != nullptr; }));
    }
    REQUIRE(inbound->is_inbound());

    // Larger than one read so the stream arrives in several chunks
    std::vector<uint8_t> payload(600 * 1024);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 31);
    }
    REQUIRE(conn->send(payload));

    {
        std::unique_lock<std::mutex> lk(m);
        REQUIRE(cv.wait_for(lk, std::chrono::seconds(10), [&] { return received.size() >= payload.size(); }));
        REQUIRE(received == payload);
    }

    SECTION("Closing one side notifies the other") {
        conn->close();
        REQUIRE_FALSE(conn->is_open());
        REQUIRE_FALSE(conn->send({1, 2, 3}));
        REQUIRE(wait_until([&] { return inbound_closed.load(); }));
    }

    conn->close();
    inbound->close();
    server.stop();
}

TEST_CASE("SctpTransport: connect failures", "[network][transport][sctp]") {
    if (!sctp_available()) {
        WARN("Skipping: SCTP sockets are not available on this host");
        return;
    }

    TestIoContext io;
    SctpTransport transport(io.get(), io.get());

    SECTION("Nothing listening") {
        // Find a port, then release it
        SctpTransport probe(io.get(), io.get());
        REQUIRE_FALSE(probe.listen("127.0.0.1", 0, ChannelBootstrap(Role::Server), [](TransportConnectionPtr) {}));
        const uint16_t port = probe.listening_port();
        probe.stop();

        std::error_code ec;
        auto conn = transport.connect("127.0.0.1", port, client_bootstrap(2000), ec);
        REQUIRE(conn == nullptr);
        REQUIRE(ec);
    }

    SECTION("Unresolvable host") {
        std::error_code ec;
        auto conn = transport.connect("no-such-host.invalid", 9000, client_bootstrap(2000), ec);
        REQUIRE(conn == nullptr);
        REQUIRE(ec);
    }
}

TEST_CASE("SctpTransport: slow reader is disconnected", "[network][transport][sctp]") {
    if (!sctp_available()) {
        WARN("Skipping: SCTP sockets are not available on this host");
        return;
    }

    TestIoContext acceptor;
    TestIoContext io;
    SctpTransport server(acceptor.get(), io.get());
    SctpTransport client(io.get(), io.get());

    std::mutex m;
    TransportConnectionPtr inbound;
    // Accept but never start reading
    REQUIRE_FALSE(server.listen("127.0.0.1", 0, ChannelBootstrap(Role::Server), [&](TransportConnectionPtr c) {
        std::lock_guard<std::mutex> lk(m);
        inbound = c;
    }));

    SendQueueLimitGuard limit(64 * 1024);

    std::error_code ec;
    auto conn = client.connect("127.0.0.1", server.listening_port(), client_bootstrap(), ec);
    REQUIRE(conn);
    conn->start();

    std::vector<uint8_t> chunk(32 * 1024, 0xAB);
    bool refused = false;
    for (int i = 0; i < 1024 && !refused; ++i) {
        refused = !conn->send(chunk);
    }

    REQUIRE(wait_until([&] { return !conn->is_open(); }));

    conn->close();
    std::lock_guard<std::mutex> lk(m);
    if (inbound) {
        inbound->close();
    }
    server.stop();
}
