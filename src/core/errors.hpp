// core/errors.hpp - Error taxonomy shared by all components
#pragma once

#include <stdexcept>
#include <string>

namespace sparkbox {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// Unknown module/container id, disallowed config key, malformed filename.
// Raised before any state is touched.
class ValidationError : public Error {
public:
  using Error::Error;
};

// Operation not permitted in the current state (core module, no secret,
// backup already running). Raised before any side effect.
class PreconditionError : public Error {
public:
  using Error::Error;
};

// Resolved name is absent at the runtime or filesystem layer.
class NotFoundError : public Error {
public:
  using Error::Error;
};

// Backup authentication tag did not verify.
class AuthenticationError : public Error {
public:
  using Error::Error;
};

// Persisted state could not be written.
class FatalError : public Error {
public:
  using Error::Error;
};

// Container engine or deployment script failed.
class RuntimeError : public Error {
public:
  using Error::Error;
};

} // namespace sparkbox
