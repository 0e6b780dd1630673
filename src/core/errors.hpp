#pragma once

#include <stdexcept>
#include <string>

namespace warden {

// Base class for all engine exceptions
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Spawning, signalling or writing to an agent subprocess failed
class ProcessError : public Error {
 public:
  ProcessError(const std::string& message, int exit_code = -1) : Error(message), exit_code_(exit_code) {}

  int exit_code() const {
    return exit_code_;
  }

 private:
  int exit_code_;
};

// The agent sent something the engine cannot act on
class ProtocolError : public Error {
 public:
  using Error::Error;
};

// A persisted transcript is missing or unreadable
class TranscriptError : public Error {
 public:
  TranscriptError(const std::string& message, std::string session_id) : Error(message), session_id_(std::move(session_id)) {}

  const std::string& session_id() const {
    return session_id_;
  }

 private:
  std::string session_id_;
};

}  // namespace warden
