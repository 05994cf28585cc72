#ifndef RCON_RESPONSE_HPP
#define RCON_RESPONSE_HPP

#include "types.hpp"

#include <cstdint>
#include <string>

namespace rcon {

/// A decoded server reply
/// Built fresh for every exchange; the body has the two padding bytes removed
class Response {
public:
    /// Construct a response from decoded header fields and body text
    Response(int32_t request_id, int32_t type, std::string body);

    /// Get the request ID echoed by the server
    int32_t GetRequestId() const;

    /// Get the packet type
    int32_t GetType() const;

    /// Get the body text
    const std::string& GetBody() const;

    /// True when the server signalled a rejected password (request ID -1)
    bool IsAuthFailure() const;

private:
    int32_t request_id_;
    int32_t type_;
    std::string body_;
};

} // namespace rcon

#endif // RCON_RESPONSE_HPP
