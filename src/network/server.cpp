// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/server.hpp"

#include "util/logging.hpp"

#include <vector>

namespace skiff {
namespace network {

Server::Server(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
               ChannelBootstrap bootstrap, std::string host, uint16_t port)
    : transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      bootstrap_(std::move(bootstrap)),
      host_(std::move(host)),
      port_(port) {}

Server::~Server() {
  stop();
}

std::error_code Server::start() {
  // Accepts may be delivered before listen() returns
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return {};
  }

  // The transport may outlive us by a few queued handlers
  std::weak_ptr<Server> weak_self = weak_from_this();
  std::error_code ec = transport_->listen(host_, port_, bootstrap_, [weak_self](TransportConnectionPtr conn) {
    if (auto self = weak_self.lock()) {
      self->on_accept(std::move(conn));
    } else {
      conn->close();
    }
  });
  if (ec) {
    running_.store(false, std::memory_order_release);
    return ec;
  }

  LOG_NET_INFO("server listening on {}:{} with {} bound type(s)", host_, local_port(),
               dispatcher_->bindings().size());
  return {};
}

void Server::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  transport_->stop();

  std::unordered_map<uint64_t, ConnectionPtr> to_close;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    to_close.swap(connections_);
  }
  for (auto& [id, conn] : to_close) {
    conn->close();
  }
  LOG_NET_INFO("server on {}:{} stopped ({} connection(s) closed)", host_, port_, to_close.size());
}

uint16_t Server::local_port() const {
  uint16_t bound = transport_->listening_port();
  return bound != 0 ? bound : port_;
}

size_t Server::connection_count() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}

void Server::on_accept(TransportConnectionPtr transport_connection) {
  ConnectionPtr conn;
  {
    // stop() clears running_ before taking this lock, so a connection added
    // here is always in the map stop() swaps out
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (running_.load(std::memory_order_acquire)) {
      conn = Connection::create(transport_connection, dispatcher_);
      connections_.emplace(conn->id(), conn);
    }
  }
  if (!conn) {
    transport_connection->close();
    return;
  }

  std::weak_ptr<Server> weak_self = weak_from_this();
  conn->start([weak_self](uint64_t id) {
    if (auto self = weak_self.lock()) {
      self->on_connection_closed(id);
    }
  });
}

void Server::on_connection_closed(uint64_t id) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.erase(id);
}

}  // namespace network
}  // namespace skiff
