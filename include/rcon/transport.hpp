#ifndef RCON_TRANSPORT_HPP
#define RCON_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>

namespace rcon {

/// Blocking byte stream the client exchanges packets over
/// The client dials a TCP transport itself unless one is supplied at construction.
/// All failures are reported as rcon::TransportError.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Write all of `size` bytes
    virtual void Write(const uint8_t* data, size_t size) = 0;

    /// Read exactly `size` bytes; a peer close before that is an error
    virtual void ReadExact(uint8_t* data, size_t size) = 0;

    /// Close the stream; no-op when already closed
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
};

} // namespace rcon

#endif // RCON_TRANSPORT_HPP
