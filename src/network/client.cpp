// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/client.hpp"

#include "errors.hpp"
#include "util/logging.hpp"

namespace skiff {
namespace network {

Client::Client(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
               ChannelBootstrap bootstrap, std::string host, uint16_t port)
    : transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      bootstrap_(std::move(bootstrap)),
      host_(std::move(host)),
      port_(port) {}

Client::~Client() {
  stop();
}

ConnectionPtr Client::connect() {
  return connect(host_, port_);
}

ConnectionPtr Client::connect(const std::string& host, uint16_t port) {
  if (!running_.load(std::memory_order_acquire)) {
    throw SessionShutdownError("client is stopped");
  }

  std::error_code ec;
  TransportConnectionPtr transport_connection = transport_->connect(host, port, bootstrap_, ec);
  if (!transport_connection) {
    if (!ec) {
      ec = std::make_error_code(std::errc::not_connected);
    }
    throw IOError("cannot connect to " + host + ":" + std::to_string(port), ec);
  }

  ConnectionPtr conn = Connection::create(std::move(transport_connection), dispatcher_);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.emplace(conn->id(), conn);
  }

  std::weak_ptr<Client> weak_self = weak_from_this();
  conn->start([weak_self](uint64_t id) {
    if (auto self = weak_self.lock()) {
      self->on_connection_closed(id);
    }
  });

  // stop() may have run while we were connecting
  if (!running_.load(std::memory_order_acquire)) {
    conn->close();
    throw SessionShutdownError("client is stopped");
  }

  LOG_NET_INFO("connected to {}:{} (connection {})", host, port, conn->id());
  return conn;
}

void Client::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  std::unordered_map<uint64_t, ConnectionPtr> to_close;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    to_close.swap(connections_);
  }
  for (auto& [id, conn] : to_close) {
    conn->close();
  }
  LOG_NET_DEBUG("client stopped ({} connection(s) closed)", to_close.size());
}

size_t Client::connection_count() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}

void Client::on_connection_closed(uint64_t id) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.erase(id);
}

}  // namespace network
}  // namespace skiff
