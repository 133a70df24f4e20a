// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/sender.hpp"

#include "errors.hpp"
#include "util/logging.hpp"

namespace skiff {
namespace network {

Sender::Sender(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
               ChannelBootstrap bootstrap, std::string host, uint16_t port)
    : transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      bootstrap_(std::move(bootstrap)),
      host_(std::move(host)),
      port_(port) {}

Sender::~Sender() {
  stop();
}

bool Sender::send(const MessageType& type, const nlohmann::json& body) {
  if (!running_.load(std::memory_order_acquire)) {
    return false;
  }

  // Encode before connecting so a bad body never opens an association
  std::vector<uint8_t> frame = encode_message(Message(type, body), dispatcher_->encoding());

  ConnectionPtr conn = ensure_connection();
  if (!conn) {
    return false;
  }
  return conn->send_encoded(type, frame);
}

ConnectionPtr Sender::ensure_connection() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return nullptr;
  }
  if (connection_ && connection_->is_open()) {
    return connection_;
  }
  if (connection_) {
    LOG_NET_DEBUG("association to {}:{} was closed, reopening", host_, port_);
  }

  std::error_code ec;
  TransportConnectionPtr transport_connection = transport_->connect(host_, port_, bootstrap_, ec);
  if (!transport_connection) {
    if (!ec) {
      ec = std::make_error_code(std::errc::not_connected);
    }
    throw IOError("cannot connect to " + host_ + ":" + std::to_string(port_), ec);
  }

  connection_ = Connection::create(std::move(transport_connection), dispatcher_);
  connection_->start();
  LOG_NET_DEBUG("sender connected to {}:{}", host_, port_);
  return connection_;
}

void Sender::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  ConnectionPtr conn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    conn = std::move(connection_);
  }
  if (conn) {
    conn->close();
  }
  LOG_NET_DEBUG("sender to {}:{} stopped", host_, port_);
}

bool Sender::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && connection_->is_open();
}

}  // namespace network
}  // namespace skiff
