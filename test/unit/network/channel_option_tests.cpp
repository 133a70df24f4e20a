// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for channel options, option partitions and ChannelBootstrap

#include <catch2/catch_test_macros.hpp>

#include "network/channel_bootstrap.hpp"
#include "network/channel_option.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

using namespace skiff::network;

TEST_CASE("OptionSet: one entry per key", "[options]") {
    OptionSet set;

    SECTION("Insert then replace keeps a single entry") {
        set.set(options::SEND_BUFFER, 4096);
        set.set(options::SEND_BUFFER, 8192);

        REQUIRE(set.size() == 1);
        REQUIRE(set.get(options::SEND_BUFFER) == 8192);
    }

    SECTION("has() ignores the value") {
        set.set(options::NO_DELAY, false);
        REQUIRE(set.has(options::NO_DELAY));
        set.set(options::NO_DELAY, true);
        REQUIRE(set.has(options::NO_DELAY));
        REQUIRE_FALSE(set.has(options::REUSE_ADDRESS));
    }

    SECTION("Re-inserting moves the entry to the end") {
        set.set(options::SEND_BUFFER, 1);
        set.set(options::RECEIVE_BUFFER, 2);
        set.set(options::SEND_BUFFER, 3);

        REQUIRE(set.size() == 2);
        REQUIRE(set.entries()[0].key.name == "so.rcvbuf");
        REQUIRE(set.entries()[1].key.name == "so.sndbuf");
        REQUIRE(std::get<int>(set.entries()[1].value) == 3);
    }

    SECTION("Keys with the same name are the same option") {
        ChannelOption<int> alias("so.sndbuf", SOL_SOCKET, SO_SNDBUF);
        set.set(options::SEND_BUFFER, 1);
        set.set(alias, 2);
        REQUIRE(set.size() == 1);
        REQUIRE(set.get(options::SEND_BUFFER) == 2);
    }

    SECTION("get() of an absent option") {
        REQUIRE_FALSE(set.get(options::BACKLOG).has_value());
    }

    SECTION("Application-defined option") {
        const ChannelOption<int> priority("so.priority", SOL_SOCKET, SO_PRIORITY);
        set.set(priority, 6);
        REQUIRE(set.get(priority) == 6);
        REQUIRE(set.find(priority.key())->key.is_socket_option());
    }
}

TEST_CASE("OptionEntry: rendering", "[options]") {
    REQUIRE(OptionEntry{options::NO_DELAY.key(), true}.to_string() == "sctp.nodelay=true");
    REQUIRE(OptionEntry{options::BACKLOG.key(), 50}.to_string() == "backlog=50");
    REQUIRE_FALSE(options::BACKLOG.key().is_socket_option());
}

TEST_CASE("ScopedOptions: partitions by role", "[options]") {
    ScopedOptions scoped;
    scoped.set(OptionScope::Shared, options::NO_DELAY, true);
    scoped.set(OptionScope::Server, options::BACKLOG, 64);
    scoped.set(OptionScope::Client, options::CONNECT_TIMEOUT_MS, 500);

    SECTION("Server sees shared and server-only entries") {
        OptionSet server = scoped.effective(Role::Server);
        REQUIRE(server.has(options::NO_DELAY));
        REQUIRE(server.has(options::BACKLOG));
        REQUIRE_FALSE(server.has(options::CONNECT_TIMEOUT_MS));
    }

    SECTION("Client sees shared and client-only entries") {
        OptionSet client = scoped.effective(Role::Client);
        REQUIRE(client.has(options::NO_DELAY));
        REQUIRE(client.has(options::CONNECT_TIMEOUT_MS));
        REQUIRE_FALSE(client.has(options::BACKLOG));
    }

    SECTION("Sender uses the client partition") {
        OptionSet sender = scoped.effective(Role::Sender);
        REQUIRE(sender.has(options::CONNECT_TIMEOUT_MS));
        REQUIRE_FALSE(sender.has(options::BACKLOG));
        REQUIRE(scope_for(Role::Sender) == OptionScope::Client);
    }

    SECTION("Role-specific value overrides shared") {
        scoped.set(OptionScope::Shared, options::SEND_BUFFER, 1000);
        scoped.set(OptionScope::Server, options::SEND_BUFFER, 2000);

        ChannelBootstrap server(Role::Server);
        scoped.apply(Role::Server, server);
        REQUIRE(server.get(options::SEND_BUFFER) == 2000);

        ChannelBootstrap client(Role::Client);
        scoped.apply(Role::Client, client);
        REQUIRE(client.get(options::SEND_BUFFER) == 1000);
    }

    SECTION("Partitions are independent") {
        REQUIRE(scoped.has(OptionScope::Server, options::BACKLOG.key()));
        REQUIRE_FALSE(scoped.has(OptionScope::Client, options::BACKLOG.key()));
        REQUIRE_FALSE(scoped.has(OptionScope::Shared, options::BACKLOG.key()));
    }
}

TEST_CASE("ChannelBootstrap: role defaults", "[options][bootstrap]") {
    SECTION("Server starts with backlog 1000") {
        ChannelBootstrap server(Role::Server);
        REQUIRE(server.backlog() == 1000);
        REQUIRE(server.get(options::BACKLOG) == DEFAULT_BACKLOG);
        REQUIRE_FALSE(server.get(options::NO_DELAY).has_value());
    }

    SECTION("Client and sender start with NO_DELAY") {
        ChannelBootstrap client(Role::Client);
        ChannelBootstrap sender(Role::Sender);
        REQUIRE(client.get(options::NO_DELAY) == true);
        REQUIRE(sender.get(options::NO_DELAY) == true);
        REQUIRE_FALSE(client.get(options::BACKLOG).has_value());
    }

    SECTION("Applied options override defaults") {
        ChannelBootstrap server(Role::Server);
        server.option(OptionEntry{options::BACKLOG.key(), 16});
        REQUIRE(server.backlog() == 16);
        REQUIRE(server.options().size() == 1);
    }

    SECTION("Connect timeout") {
        ChannelBootstrap client(Role::Client);
        REQUIRE(client.connect_timeout() == DEFAULT_CONNECT_TIMEOUT);

        client.option(OptionEntry{options::CONNECT_TIMEOUT_MS.key(), 250});
        REQUIRE(client.connect_timeout() == std::chrono::milliseconds(250));

        client.option(OptionEntry{options::CONNECT_TIMEOUT_MS.key(), 0});
        REQUIRE(client.connect_timeout() == DEFAULT_CONNECT_TIMEOUT);
    }
}
