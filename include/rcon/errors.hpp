#ifndef RCON_ERRORS_HPP
#define RCON_ERRORS_HPP

#include "types.hpp"

#include <stdexcept>
#include <string>

namespace rcon {

/// Base class of every error raised by the client
class Error : public std::runtime_error {
public:
    Error(int code, const std::string& message);

    /// One of the rcon::error_code constants
    int GetCode() const noexcept { return code_; }

private:
    int code_;
};

/// An operation needing a live session ran before Connect() or after Close()
class NotConnectedError : public Error {
public:
    NotConnectedError();
};

/// A packet length or body size does not fit the wire format's int32 fields
class IntegerOverflowError : public Error {
public:
    explicit IntegerOverflowError(const std::string& message);
};

/// The server rejected the password (echoed request ID -1)
class AuthenticationFailedError : public Error {
public:
    AuthenticationFailedError();
};

/// The server sent a packet that cannot be framed
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message);
};

/// Dial, read, write or close failure on the underlying transport
class TransportError : public Error {
public:
    TransportError(int code, const std::string& message);
};

} // namespace rcon

#endif // RCON_ERRORS_HPP
