#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace EventRelay {

class RelayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fatal: the pool could not establish one of its connections.
class ConnectionError : public RelayError {
public:
    ConnectionError(size_t streamIndex, const std::string& cause)
        : RelayError("failed to connect stream " + std::to_string(streamIndex) + ": " + cause),
          streamIndex_(streamIndex) {}

    size_t streamIndex() const { return streamIndex_; }

private:
    size_t streamIndex_;
};

class NotConnectedError : public RelayError {
public:
    NotConnectedError() : RelayError("not connected, call connect() first") {}
};

class NotStartedError : public RelayError {
public:
    NotStartedError() : RelayError("session not started") {}
};

class SessionFinalizedError : public RelayError {
public:
    SessionFinalizedError() : RelayError("session already finalized") {}
};

class ConfigError : public RelayError {
public:
    using RelayError::RelayError;
};

} // namespace EventRelay
