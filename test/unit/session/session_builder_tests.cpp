// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for SessionBuilder configuration, validation and build

#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "infra/fake_transport.hpp"
#include "infra/temp_dir.hpp"
#include "infra/test_handlers.hpp"
#include "session/session_builder.hpp"

using namespace skiff;
using namespace skiff::network;
using namespace skiff::session;
using namespace skiff::test;

namespace {

// Builder that reads no system settings files and uses the given transport.
void isolate(SessionBuilder& builder, const std::shared_ptr<FakeTransport>& transport) {
    builder.with_settings_directories({}).with_worker_threads(1).with_transport(fake_transport_factory(transport));
}

}  // namespace

TEST_CASE("SessionBuilder: defaults", "[builder]") {
    SessionBuilder builder;

    REQUIRE(builder.settings_name() == DEFAULT_SETTINGS_NAME);
    REQUIRE_FALSE(builder.is_built());

    SECTION("NO_DELAY is on for every endpoint") {
        REQUIRE(builder.has_option(OptionScope::Shared, options::NO_DELAY));
        REQUIRE(builder.options().get(OptionScope::Shared).get(options::NO_DELAY) == true);
        REQUIRE_FALSE(builder.has_option(OptionScope::Server, options::NO_DELAY));
    }

    SECTION("Built config carries default host and port") {
        auto transport = std::make_shared<FakeTransport>();
        isolate(builder, transport);
        auto control = builder.build_server();

        REQUIRE(control.config().host == DEFAULT_HOST);
        REQUIRE(control.config().port == DEFAULT_PORT);
        REQUIRE(control.config().encoding == Encoding::Binary);
        REQUIRE(control.config().acceptor_threads == 1);
        REQUIRE(control.config().settings_name == "skiff");
    }

    SECTION("Empty settings name") {
        REQUIRE_THROWS_AS(SessionBuilder(""), ConfigurationError);
    }
}

TEST_CASE("SessionBuilder: mutator validation", "[builder]") {
    SessionBuilder builder("app");

    REQUIRE_THROWS_AS(builder.on_port(0), ConfigurationError);
    REQUIRE_THROWS_AS(builder.on_port(65536), ConfigurationError);
    REQUIRE_THROWS_AS(builder.on_port(-5), ConfigurationError);
    REQUIRE_NOTHROW(builder.on_port(1));
    REQUIRE_NOTHROW(builder.on_port(65535));

    REQUIRE_THROWS_AS(builder.with_host(""), ConfigurationError);

    REQUIRE_THROWS_AS(builder.with_acceptor_threads(0), ConfigurationError);
    REQUIRE_NOTHROW(builder.with_acceptor_threads(2));

    REQUIRE_THROWS_AS(builder.with_worker_threads(0), ConfigurationError);
    REQUIRE_THROWS_AS(builder.with_worker_threads(-2), ConfigurationError);
    REQUIRE_NOTHROW(builder.with_worker_threads(-1));
    REQUIRE_NOTHROW(builder.with_worker_threads(8));

    REQUIRE_THROWS_AS(builder.with_error_handler(nullptr), ConfigurationError);
    REQUIRE_THROWS_AS(builder.with_transport(nullptr), ConfigurationError);

    SECTION("Duplicate binding") {
        builder.bind<HelloHandler>(HELLO);
        REQUIRE_THROWS_AS(builder.bind<EchoHandler>(HELLO), DuplicateBindingError);
    }

    SECTION("Option partitions are independent") {
        builder.server_option(options::BACKLOG, 10).client_option(options::CONNECT_TIMEOUT_MS, 20);
        REQUIRE(builder.has_option(OptionScope::Server, options::BACKLOG));
        REQUIRE_FALSE(builder.has_option(OptionScope::Client, options::BACKLOG));
        REQUIRE(builder.has_option(OptionScope::Client, options::CONNECT_TIMEOUT_MS));
        REQUIRE_FALSE(builder.has_option(OptionScope::Shared, options::CONNECT_TIMEOUT_MS));
    }

    SECTION("Setting an option again replaces it") {
        builder.option(options::SEND_BUFFER, 1).option(options::SEND_BUFFER, 2);
        REQUIRE(builder.options().get(OptionScope::Shared).get(options::SEND_BUFFER) == 2);
    }
}

TEST_CASE("SessionBuilder: builds exactly once", "[builder]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionBuilder builder("app");
    isolate(builder, transport);

    auto control = builder.build_client();
    REQUIRE(builder.is_built());

    SECTION("Any further build") {
        REQUIRE_THROWS_AS(builder.build_client(), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.build_server(), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.build_sender(), BuilderAlreadyBuiltError);
        REQUIRE(transport->listen_calls().empty());
    }

    SECTION("Any mutator") {
        REQUIRE_THROWS_AS(builder.on_port(9000), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.with_host("10.0.0.1"), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.with_acceptor_threads(2), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.with_worker_threads(2), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.option(options::NO_DELAY, false), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.server_option(options::BACKLOG, 1), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.client_option(options::SEND_BUFFER, 1), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.bind<HelloHandler>(HELLO), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.add_settings(SettingsMap{{"port", "1"}}), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.use_json(), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.use_bson(), BuilderAlreadyBuiltError);
        REQUIRE_THROWS_AS(builder.with_settings_directories({}), BuilderAlreadyBuiltError);
    }

    SECTION("Already-built is a configuration error") {
        REQUIRE_THROWS_AS(builder.build_server(), ConfigurationError);
    }
}

TEST_CASE("SessionBuilder: options reach the right endpoints", "[builder][options]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionBuilder builder("app");
    isolate(builder, transport);
    builder.option(options::SEND_BUFFER, 4096)
        .server_option(options::BACKLOG, 50)
        .server_option(options::RECEIVE_BUFFER, 8192)
        .client_option(options::CONNECT_TIMEOUT_MS, 100)
        .client_option(options::RECEIVE_BUFFER, 1024);

    SECTION("Server gets shared and server options") {
        auto control = builder.build_server();
        auto calls = transport->listen_calls();
        REQUIRE(calls.size() == 1);

        const ChannelBootstrap& bootstrap = calls[0].bootstrap;
        REQUIRE(bootstrap.role() == Role::Server);
        REQUIRE(bootstrap.get(options::NO_DELAY) == true);
        REQUIRE(bootstrap.get(options::SEND_BUFFER) == 4096);
        REQUIRE(bootstrap.get(options::BACKLOG) == 50);
        REQUIRE(bootstrap.get(options::RECEIVE_BUFFER) == 8192);
        REQUIRE_FALSE(bootstrap.get(options::CONNECT_TIMEOUT_MS).has_value());
        REQUIRE(control.get().bootstrap().backlog() == 50);
    }

    SECTION("Client gets shared and client options") {
        auto control = builder.build_client();
        REQUIRE(transport->listen_calls().empty());
        control.get().connect();

        auto calls = transport->connect_calls();
        REQUIRE(calls.size() == 1);
        const ChannelBootstrap& bootstrap = calls[0].bootstrap;
        REQUIRE(bootstrap.role() == Role::Client);
        REQUIRE(bootstrap.get(options::NO_DELAY) == true);
        REQUIRE(bootstrap.get(options::SEND_BUFFER) == 4096);
        REQUIRE(bootstrap.get(options::RECEIVE_BUFFER) == 1024);
        REQUIRE(bootstrap.connect_timeout() == std::chrono::milliseconds(100));
        REQUIRE_FALSE(bootstrap.get(options::BACKLOG).has_value());
    }

    SECTION("Sender uses the client options") {
        auto control = builder.build_sender();
        REQUIRE(control.get().send(NOTE, nlohmann::json::object()));

        auto calls = transport->connect_calls();
        REQUIRE(calls.size() == 1);
        const ChannelBootstrap& bootstrap = calls[0].bootstrap;
        REQUIRE(bootstrap.role() == Role::Sender);
        REQUIRE(bootstrap.get(options::RECEIVE_BUFFER) == 1024);
        REQUIRE(bootstrap.get(options::CONNECT_TIMEOUT_MS) == 100);
        REQUIRE_FALSE(bootstrap.get(options::BACKLOG).has_value());
    }

    SECTION("Shared NO_DELAY can be turned off") {
        SessionBuilder other("app");
        isolate(other, transport);
        other.option(options::NO_DELAY, false);
        auto control = other.build_client();
        control.get().connect();
        REQUIRE(transport->connect_calls()[0].bootstrap.get(options::NO_DELAY) == false);
    }
}

TEST_CASE("SessionBuilder: settings override builder values", "[builder][settings]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionBuilder builder("app");
    isolate(builder, transport);
    builder.with_host("127.0.0.1").on_port(8000);

    SECTION("Settings map") {
        builder.add_settings(SettingsMap{{"port", "9100"}, {"host", "10.0.0.9"}, {"worker.threads", "2"},
                                         {"acceptor.threads", "3"}, {"encoding", "json"}});
        auto control = builder.build_server();

        REQUIRE(control.config().port == 9100);
        REQUIRE(control.config().host == "10.0.0.9");
        REQUIRE(control.config().worker_threads == 2);
        REQUIRE(control.config().effective_worker_threads() == 2);
        REQUIRE(control.config().acceptor_threads == 3);
        REQUIRE(control.config().encoding == Encoding::Text);

        auto calls = transport->listen_calls();
        REQUIRE(calls[0].host == "10.0.0.9");
        REQUIRE(calls[0].port == 9100);
    }

    SECTION("Command line beats settings files") {
        TempDir dir("skiff_builder");
        auto file = dir.write("extra.properties", "port=9000\n");
        builder.add_settings(file);
        auto control = builder.build_server({"--port", "9200"});
        REQUIRE(control.config().port == 9200);
        REQUIRE(control.config().settings.get("port") == std::string("9200"));
    }

    SECTION("<name>.properties in a search directory") {
        TempDir dir("skiff_builder");
        dir.write("app.properties", "port=9300\nhost=192.0.2.1\ncustom.key=hello\n");
        builder.with_settings_directories({dir.path()});
        auto control = builder.build_client();

        REQUIRE(control.config().port == 9300);
        REQUIRE(control.get().host() == "192.0.2.1");
        REQUIRE(control.config().settings.get("custom.key") == std::string("hello"));
    }

    SECTION("Command line beats <name>.properties in a search directory") {
        TempDir dir("skiff_builder");
        dir.write("app.properties", "port=9000\n");
        builder.with_settings_directories({dir.path()});
        auto control = builder.build_server({"--port", "9100"});

        REQUIRE(control.config().port == 9100);
        REQUIRE(control.get().port() == 9100);
        REQUIRE(transport->listen_calls()[0].port == 9100);
    }

    SECTION("Builder values when settings are silent") {
        auto control = builder.build_client();
        REQUIRE(control.config().host == "127.0.0.1");
        REQUIRE(control.config().port == 8000);
        REQUIRE(control.get().port() == 8000);
    }

    SECTION("use_json without settings") {
        builder.use_json();
        auto control = builder.build_client();
        REQUIRE(control.config().encoding == Encoding::Text);
    }
}

TEST_CASE("SessionBuilder: invalid settings fail the build", "[builder][settings]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionBuilder builder("app");
    isolate(builder, transport);

    SECTION("Port out of range") {
        builder.add_settings(SettingsMap{{"port", "70000"}});
        REQUIRE_THROWS_AS(builder.build_server(), ConfigurationError);
    }

    SECTION("Port not a number") {
        REQUIRE_THROWS_AS(builder.build_server({"--port", "eighty"}), ConfigurationError);
    }

    SECTION("Unknown encoding") {
        builder.add_settings(SettingsMap{{"encoding", "xml"}});
        REQUIRE_THROWS_AS(builder.build_client(), ConfigurationError);
    }

    SECTION("Worker threads") {
        builder.add_settings(SettingsMap{{"worker.threads", "0"}});
        REQUIRE_THROWS_AS(builder.build_server(), ConfigurationError);
    }

    SECTION("Missing explicit settings file") {
        TempDir dir("skiff_builder");
        builder.add_settings(dir.path() / "absent.properties");
        REQUIRE_THROWS_AS(builder.build_server(), SettingsLoadError);
    }

    SECTION("Stray command-line token") {
        REQUIRE_THROWS_AS(builder.build_sender({"oops"}), ConfigurationError);
    }

    REQUIRE(transport->listen_calls().empty());
}

TEST_CASE("SessionBuilder: transport failures", "[builder]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionBuilder builder("app");
    isolate(builder, transport);
    builder.on_port(9000);

    SECTION("Listen failure is an IOError carrying the cause") {
        transport->fail_listen(std::make_error_code(std::errc::address_in_use));
        try {
            builder.build_server();
            FAIL("expected IOError");
        } catch (const IOError& e) {
            REQUIRE(e.code() == std::errc::address_in_use);
            REQUIRE(std::string(e.what()).find("127.0.0.1:9000") != std::string::npos);
        }
        // The failed build released what it started
        REQUIRE(transport->stop_calls() >= 1);
    }

    SECTION("Client connect failure") {
        transport->fail_connect(std::make_error_code(std::errc::connection_refused));
        auto control = builder.build_client();
        REQUIRE_THROWS_AS(control.get().connect(), IOError);
        REQUIRE(control.get().connection_count() == 0);
    }

    SECTION("Sender connect failure") {
        transport->fail_connect(std::make_error_code(std::errc::connection_refused));
        auto control = builder.build_sender();
        REQUIRE_THROWS_AS(control.get().send(NOTE, nlohmann::json::object()), IOError);
        REQUIRE_FALSE(control.get().is_connected());
    }

    SECTION("Factory producing no transport") {
        SessionBuilder other("app");
        other.with_settings_directories({}).with_worker_threads(1).with_transport(
            [](asio::io_context&, asio::io_context&) -> std::shared_ptr<Transport> { return nullptr; });
        REQUIRE_THROWS_AS(other.build_server(), ConfigurationError);
    }
}
