// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>

#include <asio/basic_socket_acceptor.hpp>
#include <asio/basic_stream_socket.hpp>
#include <asio/ip/basic_endpoint.hpp>

#include <netinet/in.h>
#include <sys/socket.h>

#include <linux/sctp.h>

namespace skiff {
namespace network {

// sctp - asio InternetProtocol for one-to-one style SCTP
// (SOCK_STREAM + IPPROTO_SCTP), used exactly like asio::ip::tcp.
class sctp {
public:
  using endpoint = asio::ip::basic_endpoint<sctp>;
  using socket = asio::basic_stream_socket<sctp>;
  using acceptor = asio::basic_socket_acceptor<sctp>;

  static sctp v4() noexcept { return sctp(AF_INET); }
  static sctp v6() noexcept { return sctp(AF_INET6); }

  int type() const noexcept { return SOCK_STREAM; }
  int protocol() const noexcept { return IPPROTO_SCTP; }
  int family() const noexcept { return family_; }

  friend bool operator==(const sctp& a, const sctp& b) { return a.family_ == b.family_; }
  friend bool operator!=(const sctp& a, const sctp& b) { return a.family_ != b.family_; }

private:
  explicit sctp(int family) noexcept : family_(family) {}

  int family_;
};

// Integer-valued socket option for an arbitrary (level, name); satisfies
// asio's SettableSocketOption. Boolean options travel as 0/1.
class IntegerSocketOption {
public:
  IntegerSocketOption(int level, int name, int value) : level_(level), name_(name), value_(value) {}

  template <typename Protocol>
  int level(const Protocol&) const {
    return level_;
  }
  template <typename Protocol>
  int name(const Protocol&) const {
    return name_;
  }
  template <typename Protocol>
  const void* data(const Protocol&) const {
    return &value_;
  }
  template <typename Protocol>
  std::size_t size(const Protocol&) const {
    return sizeof(value_);
  }

private:
  int level_;
  int name_;
  int value_;
};

// SCTP_INITMSG: stream counts negotiated at association setup.
class InitMsgOption {
public:
  InitMsgOption(int outbound_streams, int max_inbound_streams) : msg_{} {
    msg_.sinit_num_ostreams = static_cast<decltype(msg_.sinit_num_ostreams)>(outbound_streams);
    msg_.sinit_max_instreams = static_cast<decltype(msg_.sinit_max_instreams)>(max_inbound_streams);
  }

  template <typename Protocol>
  int level(const Protocol&) const {
    return IPPROTO_SCTP;
  }
  template <typename Protocol>
  int name(const Protocol&) const {
    return SCTP_INITMSG;
  }
  template <typename Protocol>
  const void* data(const Protocol&) const {
    return &msg_;
  }
  template <typename Protocol>
  std::size_t size(const Protocol&) const {
    return sizeof(msg_);
  }

private:
  sctp_initmsg msg_;
};

}  // namespace network
}  // namespace skiff
