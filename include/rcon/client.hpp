#ifndef RCON_CLIENT_HPP
#define RCON_CLIENT_HPP

#include "config.hpp"
#include "request_id.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rcon {

/// RCON session over one persistent connection
///
/// Strictly one exchange at a time: each call writes a packet and, except for
/// CommandNoResponse(), blocks until the matching reply is read. The client does
/// no locking; callers sharing one instance across threads must serialize access.
/// Every failure is thrown to the caller and nothing is retried.
class Client {
public:
    /// Create a client that dials config.address:config.port on Connect()
    explicit Client(ClientConfig config);

    /// Create a client over an already open transport; Connect() skips the dial
    Client(ClientConfig config, std::unique_ptr<ITransport> transport);

    /// Closes any attached transport; never throws
    ~Client();

    // Delete copy operations
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Dial (when no transport is attached) and authenticate
    /// Authentication is re-attempted on every call; an attached transport is reused.
    /// @param password RCON password sent as the auth packet body
    /// @throws TransportError on dial, write or read failure
    /// @throws AuthenticationFailedError if the server rejected the password;
    ///         the transport stays open so another password can be tried
    /// @throws IntegerOverflowError if the password is too large to frame
    void Connect(const std::string& password);

    /// Run a command and return the response body
    /// @throws NotConnectedError if no transport is attached, before any I/O
    /// @throws IntegerOverflowError, TransportError, ProtocolError
    std::string Command(const std::string& cmd);

    /// Send a command without reading its response
    /// @throws NotConnectedError, IntegerOverflowError, TransportError
    void CommandNoResponse(const std::string& cmd);

    /// Reset the request ID and close the transport, if any
    /// Closing a disconnected client is a no-op. The client can be reused with Connect().
    /// @throws TransportError if closing the transport failed
    void Close();

    /// Check if a transport is attached
    bool IsConnected() const;

    /// Get the server address
    const std::string& GetAddress() const;

    /// Get the server port
    uint16_t GetPort() const;

    /// Get the dial timeout in milliseconds
    uint32_t GetTimeout() const;

    /// Get the request ID cap
    int32_t GetCap() const;

    /// Get the ID the next packet will carry
    int32_t GetRequestId() const;

    /// Get the attached transport (nullptr when disconnected)
    ITransport* GetTransport() const;

    /// Set the ID the next packet will carry
    /// @throws std::invalid_argument if id is outside [RESET_ID, cap]
    void SetRequestId(int32_t id);

    /// Change the dial timeout
    /// @throws std::logic_error while connected
    void SetTimeout(uint32_t timeout_ms);

    /// Change the request ID cap
    /// @throws std::logic_error while connected
    /// @throws std::invalid_argument if cap < RESET_ID
    void SetCap(int32_t cap);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rcon

#endif // RCON_CLIENT_HPP
