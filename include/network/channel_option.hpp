// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace skiff {
namespace network {

class ChannelBootstrap;

// Level used by options that configure the endpoint rather than a socket
// (listen backlog, connect timeout, SCTP stream counts).
constexpr int ENDPOINT_OPTION_LEVEL = -1;

// Identity of an option. Two keys are the same option iff their names match;
// level/optname only say how a socket option is applied.
struct OptionKey {
  std::string name;
  int level{ENDPOINT_OPTION_LEVEL};
  int optname{0};

  bool is_socket_option() const { return level != ENDPOINT_OPTION_LEVEL; }

  friend bool operator==(const OptionKey& a, const OptionKey& b) { return a.name == b.name; }
};

using OptionValue = std::variant<bool, int>;

std::string option_value_to_string(const OptionValue& value);

// Typed handle over an OptionKey. Applications may declare their own over any
// (level, optname) pair:
//
//   const ChannelOption<int> PRIORITY{"priority", SOL_SOCKET, SO_PRIORITY};
template <typename T>
class ChannelOption {
  static_assert(std::is_same_v<T, bool> || std::is_same_v<T, int>, "channel options carry bool or int values");

public:
  ChannelOption(std::string name, int level, int optname) : key_{std::move(name), level, optname} {}

  const OptionKey& key() const { return key_; }
  const std::string& name() const { return key_.name; }

private:
  OptionKey key_;
};

struct OptionEntry {
  OptionKey key;
  OptionValue value;

  std::string to_string() const { return key.name + "=" + option_value_to_string(value); }
};

// OptionSet - at most one entry per option key, in insertion order
//
// Setting a key that is already present drops the old entry and appends the
// new one, so iteration order reflects the most recent assignment.
class OptionSet {
public:
  void set(const OptionKey& key, OptionValue value);

  template <typename T>
  void set(const ChannelOption<T>& option, std::type_identity_t<T> value) {
    set(option.key(), OptionValue{value});
  }

  bool has(const OptionKey& key) const { return find(key) != nullptr; }

  template <typename T>
  bool has(const ChannelOption<T>& option) const {
    return has(option.key());
  }

  template <typename T>
  std::optional<T> get(const ChannelOption<T>& option) const {
    const OptionEntry* entry = find(option.key());
    if (entry == nullptr) {
      return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&entry->value)) {
      return *value;
    }
    return std::nullopt;
  }

  const OptionEntry* find(const OptionKey& key) const;

  // Applies every entry to the target, in insertion order.
  void apply(ChannelBootstrap& target) const;

  const std::vector<OptionEntry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  std::vector<OptionEntry> entries_;
};

// Which endpoints an option set reaches.
enum class OptionScope { Shared, Server, Client };

// What a session is built as. Senders use the client partition.
enum class Role { Server, Client, Sender };

const char* role_name(Role role);
const char* scope_name(OptionScope scope);
OptionScope scope_for(Role role);

// ScopedOptions - the shared, server-only and client-only option sets
//
// A server endpoint receives shared then server-only entries; client and
// sender endpoints receive shared then client-only entries. The role-specific
// value wins when both partitions carry the same key.
class ScopedOptions {
public:
  ScopedOptions();

  void set(OptionScope scope, const OptionKey& key, OptionValue value);

  template <typename T>
  void set(OptionScope scope, const ChannelOption<T>& option, std::type_identity_t<T> value) {
    set(scope, option.key(), OptionValue{value});
  }

  bool has(OptionScope scope, const OptionKey& key) const { return get(scope).has(key); }

  const OptionSet& get(OptionScope scope) const;

  void apply(Role role, ChannelBootstrap& target) const;

  // The merged set apply() would hand to a role.
  OptionSet effective(Role role) const;

private:
  std::map<OptionScope, OptionSet> sets_;
};

// Predefined options
namespace options {

extern const ChannelOption<bool> NO_DELAY;         // SCTP_NODELAY
extern const ChannelOption<bool> REUSE_ADDRESS;    // SO_REUSEADDR
extern const ChannelOption<int> SEND_BUFFER;       // SO_SNDBUF
extern const ChannelOption<int> RECEIVE_BUFFER;    // SO_RCVBUF
extern const ChannelOption<int> OUTBOUND_STREAMS;  // SCTP_INITMSG sinit_num_ostreams
extern const ChannelOption<int> MAX_INBOUND_STREAMS;  // SCTP_INITMSG sinit_max_instreams
extern const ChannelOption<int> BACKLOG;              // listen() backlog
extern const ChannelOption<int> CONNECT_TIMEOUT_MS;   // outbound connect timeout

}  // namespace options

}  // namespace network
}  // namespace skiff
