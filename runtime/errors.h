#pragma once

#include <stdexcept>
#include <string>

namespace decodeflux {

// Base of every error raised by the generation runtime.
class GenerationError : public std::runtime_error {
public:
  explicit GenerationError(const std::string &what)
      : std::runtime_error(what) {}
};

// Config parsing, file resolution or session construction failed during
// SessionState::Load().  The state is fully released when this is thrown.
class LoadError : public GenerationError {
public:
  explicit LoadError(const std::string &what) : GenerationError(what) {}
};

// Generate() called without an active session.
class SessionNotReadyError : public GenerationError {
public:
  explicit SessionNotReadyError(const std::string &what)
      : GenerationError(what) {}
};

// The session's output map lacks a tensor the loop depends on (logits).
class MissingOutputError : public GenerationError {
public:
  explicit MissingOutputError(const std::string &what)
      : GenerationError(what) {}
};

// Malformed or non-finite values in a session output.
class InvalidOutputError : public GenerationError {
public:
  explicit InvalidOutputError(const std::string &what)
      : GenerationError(what) {}
};

// The selected index cannot be represented as a token id.  Recoverable:
// the decode loop ends early and returns what it has.
class TokenDecodeError : public GenerationError {
public:
  explicit TokenDecodeError(const std::string &what)
      : GenerationError(what) {}
};

} // namespace decodeflux
