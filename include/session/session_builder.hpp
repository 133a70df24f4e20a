// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/binding_table.hpp"
#include "network/channel_option.hpp"
#include "network/client.hpp"
#include "network/message_dispatcher.hpp"
#include "network/sender.hpp"
#include "network/server.hpp"
#include "network/transport.hpp"
#include "session/control.hpp"
#include "session/session_config.hpp"
#include "session/settings.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace skiff {
namespace session {

constexpr uint16_t DEFAULT_PORT = 8007;
constexpr const char* DEFAULT_HOST = "127.0.0.1";
constexpr const char* DEFAULT_SETTINGS_NAME = "skiff";

/**
 * SessionBuilder - configures and builds one SCTP endpoint
 *
 * Collects host/port, thread counts, channel options (shared, server-only,
 * client-only), message bindings and settings sources, then builds exactly
 * one server, client or sender:
 *
 *   SessionBuilder builder("myapp");
 *   builder.on_port(9000).bind<HelloHandler>(HELLO);
 *   auto control = builder.build_server(args);
 *
 * At build time settings are resolved (builder fields, then
 * <name>.properties in the default locations, then added sources, then the
 * command line), so a port or host from settings overrides the builder's.
 *
 * A builder builds once. After the first build_* call every mutator and
 * every further build throws BuilderAlreadyBuiltError. Configuration is
 * single-threaded.
 */
class SessionBuilder {
public:
  explicit SessionBuilder(std::string settings_name = DEFAULT_SETTINGS_NAME);

  SessionBuilder(const SessionBuilder&) = delete;
  SessionBuilder& operator=(const SessionBuilder&) = delete;

  SessionBuilder& with_host(std::string host);
  SessionBuilder& on_port(int port);
  SessionBuilder& with_acceptor_threads(int threads);
  SessionBuilder& with_worker_threads(int threads);  // >= 1, or -1 for the platform default

  // Options reaching every endpoint.
  template <typename T>
  SessionBuilder& option(const network::ChannelOption<T>& option, std::type_identity_t<T> value) {
    return set_option(network::OptionScope::Shared, option.key(), network::OptionValue{value});
  }

  template <typename T>
  SessionBuilder& server_option(const network::ChannelOption<T>& option, std::type_identity_t<T> value) {
    return set_option(network::OptionScope::Server, option.key(), network::OptionValue{value});
  }

  // Also used by senders.
  template <typename T>
  SessionBuilder& client_option(const network::ChannelOption<T>& option, std::type_identity_t<T> value) {
    return set_option(network::OptionScope::Client, option.key(), network::OptionValue{value});
  }

  bool has_option(network::OptionScope scope, const network::OptionKey& key) const;

  template <typename T>
  bool has_option(network::OptionScope scope, const network::ChannelOption<T>& option) const {
    return has_option(scope, option.key());
  }

  const network::ScopedOptions& options() const { return options_; }

  SessionBuilder& bind(const network::MessageType& type, network::HandlerDescriptor handler);

  template <typename H>
  SessionBuilder& bind(const network::MessageType& type) {
    return bind(type, network::handler_descriptor<H>());
  }

  // Explicit sources, applied in the order added. A file that cannot be
  // read or parsed fails the build with SettingsLoadError.
  SessionBuilder& add_settings(const std::filesystem::path& path);
  SessionBuilder& add_settings(const SettingsMap& values);

  // Directories searched for <settings_name>.properties. Defaults to
  // default_settings_directories().
  SessionBuilder& with_settings_directories(std::vector<std::filesystem::path> directories);

  SessionBuilder& use_bson();
  SessionBuilder& use_json();

  SessionBuilder& with_error_handler(network::ErrorHandler handler);

  // Replaces the SCTP transport, e.g. with an in-process one.
  SessionBuilder& with_transport(network::TransportFactory factory);

  // Each throws ConfigurationError, SettingsLoadError or IOError on failure;
  // nothing started by a failed build is left running.
  Control<network::Server> build_server(std::vector<std::string> args = {});
  Control<network::Client> build_client(std::vector<std::string> args = {});
  Control<network::Sender> build_sender(std::vector<std::string> args = {});

  bool is_built() const { return state_.load(std::memory_order_acquire) == State::Built; }
  const std::string& settings_name() const { return settings_name_; }

private:
  enum class State { Open, Built };

  // What every build variant needs before it constructs its role object.
  struct Prepared {
    std::shared_ptr<const SessionConfig> config;
    std::unique_ptr<ResourceGraph> resources;
    std::shared_ptr<network::Transport> transport;
    std::shared_ptr<network::MessageDispatcher> dispatcher;
    network::ChannelBootstrap bootstrap;
  };

  void ensure_open() const;
  void transition_to_built();

  SessionBuilder& set_option(network::OptionScope scope, const network::OptionKey& key, network::OptionValue value);

  Settings resolve_settings(std::vector<std::string> args) const;
  std::shared_ptr<const SessionConfig> make_config(network::Role role, Settings settings);
  Prepared prepare(network::Role role, std::vector<std::string> args);

  std::atomic<State> state_{State::Open};

  std::string settings_name_;
  std::string host_{DEFAULT_HOST};
  int port_{DEFAULT_PORT};
  int acceptor_threads_{1};
  int worker_threads_{-1};
  network::Encoding encoding_{network::Encoding::Binary};

  network::ScopedOptions options_;
  network::BindingTable bindings_;
  network::ErrorHandler error_handler_;
  network::TransportFactory transport_factory_;

  std::vector<std::variant<std::filesystem::path, SettingsMap>> settings_sources_;
  std::optional<std::vector<std::filesystem::path>> settings_directories_;
};

}  // namespace session
}  // namespace skiff
