// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_builder.hpp"

#include "errors.hpp"
#include "network/event_loop_group.hpp"
#include "util/logging.hpp"

namespace skiff {
namespace session {

namespace {

int validate_port(int port, const char* source) {
  if (port < 1 || port > 65535) {
    throw ConfigurationError(std::string("port from ") + source + " must be in 1..65535, got " +
                             std::to_string(port));
  }
  return port;
}

int validate_acceptor_threads(int threads, const char* source) {
  if (threads < 1) {
    throw ConfigurationError(std::string("acceptor threads from ") + source + " must be >= 1, got " +
                             std::to_string(threads));
  }
  return threads;
}

int validate_worker_threads(int threads, const char* source) {
  if (threads < 1 && threads != network::USE_PLATFORM_DEFAULT_THREADS) {
    throw ConfigurationError(std::string("worker threads from ") + source + " must be >= 1 or -1, got " +
                             std::to_string(threads));
  }
  return threads;
}

}  // namespace

size_t SessionConfig::effective_worker_threads() const {
  if (worker_threads == network::USE_PLATFORM_DEFAULT_THREADS) {
    return network::platform_default_threads();
  }
  return static_cast<size_t>(worker_threads);
}

SessionBuilder::SessionBuilder(std::string settings_name) : settings_name_(std::move(settings_name)) {
  if (settings_name_.empty()) {
    throw ConfigurationError("settings name must not be empty");
  }
  options_.set(network::OptionScope::Shared, network::options::NO_DELAY, true);
}

void SessionBuilder::ensure_open() const {
  if (state_.load(std::memory_order_acquire) != State::Open) {
    throw BuilderAlreadyBuiltError();
  }
}

void SessionBuilder::transition_to_built() {
  State expected = State::Open;
  if (!state_.compare_exchange_strong(expected, State::Built, std::memory_order_acq_rel)) {
    throw BuilderAlreadyBuiltError();
  }
}

SessionBuilder& SessionBuilder::with_host(std::string host) {
  ensure_open();
  if (host.empty()) {
    throw ConfigurationError("host must not be empty");
  }
  host_ = std::move(host);
  return *this;
}

SessionBuilder& SessionBuilder::on_port(int port) {
  ensure_open();
  port_ = validate_port(port, "on_port");
  return *this;
}

SessionBuilder& SessionBuilder::with_acceptor_threads(int threads) {
  ensure_open();
  acceptor_threads_ = validate_acceptor_threads(threads, "with_acceptor_threads");
  return *this;
}

SessionBuilder& SessionBuilder::with_worker_threads(int threads) {
  ensure_open();
  worker_threads_ = validate_worker_threads(threads, "with_worker_threads");
  return *this;
}

SessionBuilder& SessionBuilder::set_option(network::OptionScope scope, const network::OptionKey& key,
                                           network::OptionValue value) {
  ensure_open();
  if (key.name.empty()) {
    throw ConfigurationError("option name must not be empty");
  }
  options_.set(scope, key, value);
  return *this;
}

bool SessionBuilder::has_option(network::OptionScope scope, const network::OptionKey& key) const {
  return options_.has(scope, key);
}

SessionBuilder& SessionBuilder::bind(const network::MessageType& type, network::HandlerDescriptor handler) {
  ensure_open();
  bindings_.bind(type, std::move(handler));
  return *this;
}

SessionBuilder& SessionBuilder::add_settings(const std::filesystem::path& path) {
  ensure_open();
  settings_sources_.emplace_back(path);
  return *this;
}

SessionBuilder& SessionBuilder::add_settings(const SettingsMap& values) {
  ensure_open();
  settings_sources_.emplace_back(values);
  return *this;
}

SessionBuilder& SessionBuilder::with_settings_directories(std::vector<std::filesystem::path> directories) {
  ensure_open();
  settings_directories_ = std::move(directories);
  return *this;
}

SessionBuilder& SessionBuilder::use_bson() {
  ensure_open();
  encoding_ = network::Encoding::Binary;
  return *this;
}

SessionBuilder& SessionBuilder::use_json() {
  ensure_open();
  encoding_ = network::Encoding::Text;
  return *this;
}

SessionBuilder& SessionBuilder::with_error_handler(network::ErrorHandler handler) {
  ensure_open();
  if (!handler) {
    throw ConfigurationError("error handler must not be empty");
  }
  error_handler_ = std::move(handler);
  return *this;
}

SessionBuilder& SessionBuilder::with_transport(network::TransportFactory factory) {
  ensure_open();
  if (!factory) {
    throw ConfigurationError("transport factory must not be empty");
  }
  transport_factory_ = std::move(factory);
  return *this;
}

Settings SessionBuilder::resolve_settings(std::vector<std::string> args) const {
  SettingsBuilder settings(settings_name_);
  settings.add("port", std::to_string(port_)).add("host", host_);

  if (settings_directories_) {
    settings.add_default_locations(*settings_directories_);
  } else {
    settings.add_default_locations();
  }

  for (const auto& source : settings_sources_) {
    if (const auto* path = std::get_if<std::filesystem::path>(&source)) {
      settings.add_file(*path);
    } else {
      settings.add(std::get<SettingsMap>(source));
    }
  }

  settings.add_command_line(std::move(args));
  return settings.build();
}

std::shared_ptr<const SessionConfig> SessionBuilder::make_config(network::Role role, Settings settings) {
  auto config = std::make_shared<SessionConfig>();
  config->settings_name = settings_name_;
  config->role = role;
  config->options = options_;
  config->bindings = bindings_.freeze();

  config->port = static_cast<uint16_t>(validate_port(settings.get_int("port").value_or(port_), "settings"));
  config->host = settings.get_or("host", host_);
  if (config->host.empty()) {
    throw ConfigurationError("host from settings must not be empty");
  }
  config->acceptor_threads =
      validate_acceptor_threads(settings.get_int("acceptor.threads").value_or(acceptor_threads_), "settings");
  config->worker_threads =
      validate_worker_threads(settings.get_int("worker.threads").value_or(worker_threads_), "settings");

  config->encoding = encoding_;
  if (auto name = settings.get("encoding")) {
    auto encoding = network::parse_encoding(*name);
    if (!encoding) {
      throw ConfigurationError("unknown encoding '" + *name + "' (expected bson or json)");
    }
    config->encoding = *encoding;
  }

  config->settings = std::move(settings);
  return config;
}

SessionBuilder::Prepared SessionBuilder::prepare(network::Role role, std::vector<std::string> args) {
  transition_to_built();

  std::shared_ptr<const SessionConfig> config = make_config(role, resolve_settings(std::move(args)));

  auto resources = std::make_unique<ResourceGraph>();
  asio::io_context* acceptor_context = nullptr;
  asio::io_context* io_context = nullptr;
  if (role == network::Role::Server) {
    acceptor_context = &resources->add_group("acceptor", static_cast<size_t>(config->acceptor_threads)).io_context();
    io_context = &resources->add_group("worker", config->effective_worker_threads()).io_context();
  } else {
    io_context = &resources->add_group(network::role_name(role), static_cast<size_t>(config->acceptor_threads))
                      .io_context();
    acceptor_context = io_context;
  }

  auto dispatcher = std::make_shared<network::MessageDispatcher>(config->bindings, config->encoding, error_handler_);

  network::TransportFactory factory = transport_factory_ ? transport_factory_ : network::sctp_transport_factory();
  std::shared_ptr<network::Transport> transport = factory(*acceptor_context, *io_context);
  if (!transport) {
    throw ConfigurationError("transport factory produced no transport");
  }
  resources->set_transport(transport);
  resources->set_dispatcher(dispatcher);

  network::ChannelBootstrap bootstrap(role);
  config->options.apply(role, bootstrap);

  resources->start();

  LOG_SESSION_INFO("built {} '{}' for {}:{} ({} binding(s), {} encoding)", network::role_name(role), settings_name_,
                   config->host, config->port, config->bindings->size(), network::encoding_name(config->encoding));
  for (const auto& entry : bootstrap.options().entries()) {
    LOG_SESSION_DEBUG("  {} option {}", network::role_name(role), entry.to_string());
  }

  return Prepared{std::move(config), std::move(resources), std::move(transport), std::move(dispatcher),
                  std::move(bootstrap)};
}

Control<network::Server> SessionBuilder::build_server(std::vector<std::string> args) {
  Prepared prepared = prepare(network::Role::Server, std::move(args));
  const SessionConfig& config = *prepared.config;

  auto server = std::make_shared<network::Server>(prepared.transport, prepared.dispatcher,
                                                  std::move(prepared.bootstrap), config.host, config.port);
  std::error_code ec = server->start();
  if (ec) {
    prepared.resources->release();
    throw IOError("cannot listen on " + config.host + ":" + std::to_string(config.port), ec);
  }
  return Control<network::Server>(std::move(server), std::move(prepared.config), std::move(prepared.resources));
}

Control<network::Client> SessionBuilder::build_client(std::vector<std::string> args) {
  Prepared prepared = prepare(network::Role::Client, std::move(args));
  const SessionConfig& config = *prepared.config;

  auto client = std::make_shared<network::Client>(prepared.transport, prepared.dispatcher,
                                                  std::move(prepared.bootstrap), config.host, config.port);
  return Control<network::Client>(std::move(client), std::move(prepared.config), std::move(prepared.resources));
}

Control<network::Sender> SessionBuilder::build_sender(std::vector<std::string> args) {
  Prepared prepared = prepare(network::Role::Sender, std::move(args));
  const SessionConfig& config = *prepared.config;

  auto sender = std::make_shared<network::Sender>(prepared.transport, prepared.dispatcher,
                                                  std::move(prepared.bootstrap), config.host, config.port);
  return Control<network::Sender>(std::move(sender), std::move(prepared.config), std::move(prepared.resources));
}

}  // namespace session
}  // namespace skiff
