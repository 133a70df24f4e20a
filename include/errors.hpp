// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace skiff {

// Root of every exception thrown across the public API.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid or conflicting configuration, detected before any resource is
// allocated.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// A configuration call or a second build reached a builder that has already
// built its session.
class BuilderAlreadyBuiltError : public ConfigurationError {
public:
  BuilderAlreadyBuiltError() : ConfigurationError("build method already called") {}
};

class DuplicateBindingError : public ConfigurationError {
public:
  using ConfigurationError::ConfigurationError;
};

// An explicitly declared settings source could not be read or parsed.
class SettingsLoadError : public Error {
public:
  using Error::Error;
};

// The endpoint or its resources could not be constructed (address in use,
// protocol not supported, connection refused, ...).
class IOError : public Error {
public:
  IOError(const std::string& what, std::error_code code) : Error(what + ": " + code.message()), code_(code) {}
  explicit IOError(const std::string& what) : Error(what) {}

  const std::error_code& code() const noexcept { return code_; }

private:
  std::error_code code_;
};

// Access to a session object after its Control was shut down.
class SessionShutdownError : public Error {
public:
  using Error::Error;
};

// A frame or payload could not be encoded or decoded.
class CodecError : public Error {
public:
  using Error::Error;
};

}  // namespace skiff
