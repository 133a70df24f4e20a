// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/sctp_transport.hpp"

#include "util/logging.hpp"

#include <cassert>
#include <future>
#include <variant>

namespace skiff {
namespace network {

namespace {

// Sets every socket-level option in the bootstrap, then SCTP_INITMSG when a
// stream count is configured. Options the kernel rejects are logged and skipped.
template <typename Socket>
void apply_socket_options(Socket& socket, const ChannelBootstrap& bootstrap) {
  for (const auto& entry : bootstrap.options().entries()) {
    if (!entry.key.is_socket_option()) {
      continue;
    }
    int value = std::visit([](auto v) { return static_cast<int>(v); }, entry.value);
    asio::error_code ec;
    socket.set_option(IntegerSocketOption(entry.key.level, entry.key.optname, value), ec);
    if (ec) {
      LOG_NET_WARN("failed to set {} on {} socket: {}", entry.to_string(), role_name(bootstrap.role()),
                   ec.message());
    }
  }

  auto outbound = bootstrap.get(options::OUTBOUND_STREAMS);
  auto inbound = bootstrap.get(options::MAX_INBOUND_STREAMS);
  if (outbound || inbound) {
    asio::error_code ec;
    socket.set_option(InitMsgOption(outbound.value_or(0), inbound.value_or(0)), ec);
    if (ec) {
      LOG_NET_WARN("failed to set SCTP stream counts on {} socket: {}", role_name(bootstrap.role()), ec.message());
    }
  }
}

}  // namespace

// ============================================================================
// SctpConnection
// ============================================================================

std::atomic<size_t> SctpConnection::send_queue_limit_override_bytes_{0};

std::shared_ptr<SctpConnection> SctpConnection::create(asio::io_context& io_context, sctp::socket socket,
                                                       bool is_inbound) {
  return std::shared_ptr<SctpConnection>(new SctpConnection(io_context, std::move(socket), is_inbound));
}

SctpConnection::SctpConnection(asio::io_context& io_context, sctp::socket socket, bool is_inbound)
    : io_context_(io_context),
      socket_(std::move(socket)),
      strand_(io_context.get_executor()),
      is_inbound_(is_inbound) {
  open_ = socket_.is_open();

  asio::error_code ec;
  auto remote_ep = socket_.remote_endpoint(ec);
  if (ec) {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  } else {
    remote_addr_ = remote_ep.address().to_string();
    remote_port_ = remote_ep.port();
  }
}

void SctpConnection::set_send_queue_limit_for_test(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void SctpConnection::start() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void SctpConnection::start_read_impl() {
  if (!open_)
    return;

  assert(strand_.running_in_this_thread());

  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);

  auto read_handler = [this, self = shared_from_this(), buf](const asio::error_code& ec, size_t bytes_transferred) {
    if (!open_) {
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_, ec.message());
      }
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (bytes_transferred > 0) {
      // Copy: the callback may replace itself
      ReceiveCallback saved_receive_cb = receive_callback_;
      if (saved_receive_cb) {
        std::vector<uint8_t> data(buf->begin(), buf->begin() + static_cast<std::ptrdiff_t>(bytes_transferred));
        try {
          saved_receive_cb(data);
        } catch (const std::exception& e) {
          LOG_NET_ERROR("receive callback failed for {}:{}: {}", remote_addr_, remote_port_, e.what());
          deliver_disconnect_once();
          close_impl();
          return;
        }
      }

      if (!open_) {
        return;
      }
    }

    start_read_impl();
  };

  socket_.async_read_some(asio::buffer(*buf), asio::bind_executor(strand_, read_handler));
}

bool SctpConnection::send(const std::vector<uint8_t>& data) {
  if (!open_)
    return false;
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_)
      return;

    size_t limit = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
    if (limit == 0)
      limit = DEFAULT_SEND_QUEUE_SIZE;
    if (send_queue_bytes_ + payload->size() > limit) {
      LOG_NET_WARN_RL("send queue overflow ({} + {} > {} bytes), disconnecting slow-reading peer {}:{}",
                      send_queue_bytes_, payload->size(), limit, remote_addr_, remote_port_);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_.exchange(true, std::memory_order_acquire)) {
      do_write_impl();
    }
  });
  return true;
}

void SctpConnection::do_write_impl() {
  if (!open_)
    return;

  assert(strand_.running_in_this_thread());

  if (send_queue_.empty()) {
    writing_.store(false, std::memory_order_release);
    return;
  }

  auto data_ptr = send_queue_.front();

  auto write_handler = [this, self = shared_from_this(), data_ptr](const asio::error_code& ec, size_t) {
    if (!open_) {
      return;
    }

    if (ec) {
      LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_, ec.message());
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.pop();
    send_queue_bytes_ -= data_ptr->size();

    if (!send_queue_.empty()) {
      do_write_impl();
    } else {
      writing_.store(false, std::memory_order_release);
    }
  };

  asio::async_write(socket_, asio::buffer(*data_ptr), asio::bind_executor(strand_, write_handler));
}

void SctpConnection::deliver_disconnect_once() {
  assert(strand_.running_in_this_thread());

  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception& e) {
        LOG_NET_ERROR("disconnect callback failed: {}", e.what());
      }
    });
  }
}

void SctpConnection::close() {
  asio::dispatch(strand_, [this, self = shared_from_this()]() {
    deliver_disconnect_once();
    close_impl();
  });
}

void SctpConnection::close_impl() {
  assert(strand_.running_in_this_thread());

  if (!open_.exchange(false)) {
    return;
  }

  {
    sctp::socket socket_to_close(std::move(socket_));
    asio::error_code ec;
    socket_to_close.shutdown(asio::socket_base::shutdown_both, ec);
    socket_to_close.close(ec);
  }

  receive_callback_ = {};
  disconnect_callback_ = {};

  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_.store(false, std::memory_order_release);
}

bool SctpConnection::is_open() const {
  return open_;
}

std::string SctpConnection::remote_address() const {
  return remote_addr_;
}

uint16_t SctpConnection::remote_port() const {
  return remote_port_;
}

void SctpConnection::set_receive_callback(ReceiveCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    // Installing after close would keep the owner alive through the callback
    if (!open_)
      return;
    receive_callback_ = std::move(cb);
  });
}

void SctpConnection::set_disconnect_callback(DisconnectCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    // Installing after close would keep the owner alive through the callback
    if (!open_)
      return;
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// SctpTransport
// ============================================================================

TransportFactory sctp_transport_factory() {
  return [](asio::io_context& acceptor_context, asio::io_context& io_context) -> std::shared_ptr<Transport> {
    return std::make_shared<SctpTransport>(acceptor_context, io_context);
  };
}

SctpTransport::SctpTransport(asio::io_context& acceptor_context, asio::io_context& io_context)
    : acceptor_context_(acceptor_context), io_context_(io_context) {}

SctpTransport::~SctpTransport() {
  stop();
}

std::vector<sctp::endpoint> SctpTransport::resolve(const std::string& host, uint16_t port, std::error_code& ec) {
  std::vector<sctp::endpoint> endpoints;

  asio::error_code parse_ec;
  asio::ip::address address = asio::ip::make_address(host, parse_ec);
  if (!parse_ec) {
    endpoints.emplace_back(address, port);
    ec.clear();
    return endpoints;
  }

  asio::ip::tcp::resolver resolver(io_context_);
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    LOG_NET_DEBUG("failed to resolve {}: {}", host, ec.message());
    return endpoints;
  }
  for (const auto& result : results) {
    endpoints.emplace_back(result.endpoint().address(), result.endpoint().port());
  }
  if (endpoints.empty()) {
    ec = asio::error::host_not_found;
  }
  return endpoints;
}

std::error_code SctpTransport::listen(const std::string& host, uint16_t port, const ChannelBootstrap& bootstrap,
                                      AcceptCallback on_accept) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return asio::error::already_open;
  }

  std::error_code ec;
  std::vector<sctp::endpoint> endpoints = resolve(host, port, ec);
  if (ec) {
    return ec;
  }
  const sctp::endpoint& endpoint = endpoints.front();

  auto acceptor = std::make_unique<sctp::acceptor>(acceptor_context_);
  acceptor->open(endpoint.protocol(), ec);
  if (ec) {
    LOG_NET_ERROR("failed to open SCTP socket for {}:{}: {}", host, port, ec.message());
    return ec;
  }
  apply_socket_options(*acceptor, bootstrap);

  acceptor->bind(endpoint, ec);
  if (!ec) {
    acceptor->listen(bootstrap.backlog(), ec);
  }
  if (ec) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", host, port, ec.message());
    asio::error_code close_ec;
    acceptor->close(close_ec);
    return ec;
  }

  // Record the actual bound port (handles ephemeral port 0)
  asio::error_code local_ec;
  auto local = acceptor->local_endpoint(local_ec);
  listen_port_.store(local_ec ? port : local.port(), std::memory_order_release);

  acceptor_ = std::move(acceptor);
  accept_bootstrap_ = std::make_shared<ChannelBootstrap>(bootstrap);
  accept_callback_ = std::move(on_accept);

  LOG_NET_INFO("listening on {}:{} (backlog {})", host, listening_port(), bootstrap.backlog());
  start_accept();
  return {};
}

void SctpTransport::start_accept() {
  if (!acceptor_)
    return;

  // Accepted associations live on the worker context
  auto socket = std::make_shared<sctp::socket>(io_context_);
  acceptor_->async_accept(*socket, [this, socket](const asio::error_code& ec) { handle_accept(ec, socket); });
}

void SctpTransport::handle_accept(const asio::error_code& ec, const std::shared_ptr<sctp::socket>& socket) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (ec) {
    if (ec != asio::error::operation_aborted && acceptor_) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }
  if (!acceptor_) {
    return;
  }

  apply_socket_options(*socket, *accept_bootstrap_);

  auto conn = SctpConnection::create(io_context_, std::move(*socket), true);
  LOG_NET_DEBUG("association from {}:{} accepted", conn->remote_address(), conn->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(conn);
    } catch (const std::exception& e) {
      LOG_NET_ERROR("accept callback failed for {}:{}: {}", conn->remote_address(), conn->remote_port(), e.what());
      conn->close();
    }
  }

  start_accept();
}

TransportConnectionPtr SctpTransport::connect(const std::string& host, uint16_t port,
                                              const ChannelBootstrap& bootstrap, std::error_code& ec) {
  std::vector<sctp::endpoint> endpoints = resolve(host, port, ec);
  if (ec) {
    return nullptr;
  }

  for (const auto& endpoint : endpoints) {
    auto conn = connect_endpoint(endpoint, bootstrap, ec);
    if (conn) {
      LOG_NET_DEBUG("connected to {}:{}", host, port);
      return conn;
    }
    LOG_NET_DEBUG("connect to {}:{} via {} failed: {}", host, port, endpoint.address().to_string(), ec.message());
  }
  return nullptr;
}

std::shared_ptr<SctpConnection> SctpTransport::connect_endpoint(const sctp::endpoint& endpoint,
                                                                const ChannelBootstrap& bootstrap,
                                                                std::error_code& ec) {
  auto socket = std::make_shared<sctp::socket>(io_context_);
  socket->open(endpoint.protocol(), ec);
  if (ec) {
    return nullptr;
  }
  apply_socket_options(*socket, bootstrap);

  auto done = std::make_shared<std::promise<asio::error_code>>();
  std::future<asio::error_code> result = done->get_future();
  socket->async_connect(endpoint, [done](const asio::error_code& connect_ec) { done->set_value(connect_ec); });

  const auto timeout = bootstrap.connect_timeout();
  if (result.wait_for(timeout) != std::future_status::ready) {
    asio::post(io_context_, [socket]() {
      asio::error_code ignored;
      socket->close(ignored);
    });
    // Let the aborted handler run before the socket is reused; the handler
    // keeps its own references if the context has already stopped.
    (void)result.wait_for(timeout);
    ec = asio::error::timed_out;
    return nullptr;
  }

  ec = result.get();
  if (ec) {
    asio::error_code ignored;
    socket->close(ignored);
    return nullptr;
  }
  return SctpConnection::create(io_context_, std::move(*socket), false);
}

void SctpTransport::stop() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
    LOG_NET_DEBUG("stopped listening");
  }
  listen_port_.store(0, std::memory_order_release);
  accept_callback_ = {};
}

}  // namespace network
}  // namespace skiff
