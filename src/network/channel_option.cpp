// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/channel_option.hpp"

#include "network/channel_bootstrap.hpp"

#include <algorithm>

#include <netinet/in.h>
#include <sys/socket.h>

#include <linux/sctp.h>

namespace skiff {
namespace network {

namespace options {

const ChannelOption<bool> NO_DELAY{"sctp.nodelay", IPPROTO_SCTP, SCTP_NODELAY};
const ChannelOption<bool> REUSE_ADDRESS{"so.reuseaddr", SOL_SOCKET, SO_REUSEADDR};
const ChannelOption<int> SEND_BUFFER{"so.sndbuf", SOL_SOCKET, SO_SNDBUF};
const ChannelOption<int> RECEIVE_BUFFER{"so.rcvbuf", SOL_SOCKET, SO_RCVBUF};
const ChannelOption<int> OUTBOUND_STREAMS{"sctp.outbound_streams", ENDPOINT_OPTION_LEVEL, 0};
const ChannelOption<int> MAX_INBOUND_STREAMS{"sctp.max_inbound_streams", ENDPOINT_OPTION_LEVEL, 0};
const ChannelOption<int> BACKLOG{"backlog", ENDPOINT_OPTION_LEVEL, 0};
const ChannelOption<int> CONNECT_TIMEOUT_MS{"connect_timeout_ms", ENDPOINT_OPTION_LEVEL, 0};

}  // namespace options

std::string option_value_to_string(const OptionValue& value) {
  if (const bool* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  return std::to_string(std::get<int>(value));
}

void OptionSet::set(const OptionKey& key, OptionValue value) {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&key](const OptionEntry& entry) { return entry.key == key; }),
                 entries_.end());
  entries_.push_back(OptionEntry{key, value});
}

const OptionEntry* OptionSet::find(const OptionKey& key) const {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&key](const OptionEntry& entry) { return entry.key == key; });
  return it == entries_.end() ? nullptr : &*it;
}

void OptionSet::apply(ChannelBootstrap& target) const {
  for (const auto& entry : entries_) {
    target.option(entry);
  }
}

const char* role_name(Role role) {
  switch (role) {
  case Role::Server:
    return "server";
  case Role::Client:
    return "client";
  case Role::Sender:
    return "sender";
  }
  return "unknown";
}

const char* scope_name(OptionScope scope) {
  switch (scope) {
  case OptionScope::Shared:
    return "shared";
  case OptionScope::Server:
    return "server";
  case OptionScope::Client:
    return "client";
  }
  return "unknown";
}

OptionScope scope_for(Role role) {
  return role == Role::Server ? OptionScope::Server : OptionScope::Client;
}

ScopedOptions::ScopedOptions() {
  sets_[OptionScope::Shared];
  sets_[OptionScope::Server];
  sets_[OptionScope::Client];
}

void ScopedOptions::set(OptionScope scope, const OptionKey& key, OptionValue value) {
  sets_[scope].set(key, value);
}

const OptionSet& ScopedOptions::get(OptionScope scope) const {
  return sets_.at(scope);
}

void ScopedOptions::apply(Role role, ChannelBootstrap& target) const {
  get(OptionScope::Shared).apply(target);
  get(scope_for(role)).apply(target);
}

OptionSet ScopedOptions::effective(Role role) const {
  OptionSet merged;
  for (const OptionScope scope : {OptionScope::Shared, scope_for(role)}) {
    for (const auto& entry : get(scope).entries()) {
      merged.set(entry.key, entry.value);
    }
  }
  return merged;
}

}  // namespace network
}  // namespace skiff
