#ifndef RCON_TCP_TRANSPORT_HPP
#define RCON_TCP_TRANSPORT_HPP

#include "rcon/transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace rcon {
namespace internal {

/// Blocking TCP transport using asio
class TcpTransport : public ITransport {
public:
    ~TcpTransport() override;

    // Delete copy operations
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /// Resolve and connect to host:port, giving up after `timeout`
    /// A zero timeout waits for the operating system's own connect timeout.
    /// @throws TransportError with CONNECTION_TIMEOUT or CONNECTION_FAILED
    static std::unique_ptr<TcpTransport> Dial(const std::string& host, uint16_t port,
                                              std::chrono::milliseconds timeout);

    void Write(const uint8_t* data, size_t size) override;

    void ReadExact(uint8_t* data, size_t size) override;

    void Close() override;

    bool IsOpen() const override;

private:
    TcpTransport();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace internal
} // namespace rcon

#endif // RCON_TCP_TRANSPORT_HPP
