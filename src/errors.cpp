#include "rcon/errors.hpp"

namespace rcon {

Error::Error(int code, const std::string& message)
    : std::runtime_error(message)
    , code_(code)
{}

NotConnectedError::NotConnectedError()
    : Error(error_code::NOT_CONNECTED, "Not connected")
{}

IntegerOverflowError::IntegerOverflowError(const std::string& message)
    : Error(error_code::INTEGER_OVERFLOW, message)
{}

AuthenticationFailedError::AuthenticationFailedError()
    : Error(error_code::AUTHENTICATION_FAILED, "Authentication failed")
{}

ProtocolError::ProtocolError(const std::string& message)
    : Error(error_code::PROTOCOL_VIOLATION, message)
{}

TransportError::TransportError(int code, const std::string& message)
    : Error(code, message)
{}

} // namespace rcon
