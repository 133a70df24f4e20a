// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/channel_bootstrap.hpp"

namespace skiff {
namespace network {

ChannelBootstrap::ChannelBootstrap(Role role) : role_(role) {
  if (role_ == Role::Server) {
    options_.set(options::BACKLOG, DEFAULT_BACKLOG);
  } else {
    options_.set(options::NO_DELAY, true);
  }
}

ChannelBootstrap& ChannelBootstrap::option(const OptionEntry& entry) {
  options_.set(entry.key, entry.value);
  return *this;
}

int ChannelBootstrap::backlog() const {
  return options_.get(options::BACKLOG).value_or(DEFAULT_BACKLOG);
}

std::chrono::milliseconds ChannelBootstrap::connect_timeout() const {
  auto timeout = options_.get(options::CONNECT_TIMEOUT_MS);
  if (!timeout || *timeout <= 0) {
    return DEFAULT_CONNECT_TIMEOUT;
  }
  return std::chrono::milliseconds(*timeout);
}

}  // namespace network
}  // namespace skiff
