// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/channel_option.hpp"

#include <chrono>
#include <optional>

namespace skiff {
namespace network {

constexpr int DEFAULT_BACKLOG = 1000;
constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(10)};

// ChannelBootstrap - option state for the sockets of one role
//
// The transport reads it when it opens the acceptor (server) or an outbound
// socket (client, sender). A server bootstrap starts with BACKLOG=1000, a
// client or sender bootstrap with NO_DELAY=true; option partitions are
// applied on top.
class ChannelBootstrap {
public:
  explicit ChannelBootstrap(Role role);

  Role role() const { return role_; }

  ChannelBootstrap& option(const OptionEntry& entry);

  template <typename T>
  std::optional<T> get(const ChannelOption<T>& option) const {
    return options_.get(option);
  }

  const OptionSet& options() const { return options_; }

  int backlog() const;
  std::chrono::milliseconds connect_timeout() const;

private:
  Role role_;
  OptionSet options_;
};

}  // namespace network
}  // namespace skiff
