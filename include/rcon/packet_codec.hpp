#ifndef RCON_PACKET_CODEC_HPP
#define RCON_PACKET_CODEC_HPP

#include "response.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rcon {

/// Fixed 12-byte header at the front of every packet
struct PacketHeader {
    int32_t size;        // byte count after the Length field
    int32_t request_id;
    int32_t type;
};

/// PacketCodec handles encoding and decoding of RCON packets
///
/// Packet Format (both directions, little-endian):
///   [Length: 4B] - len(Body) + 10, excluding this field
///   [RequestId: 4B]
///   [Type: 4B] - 2 = command, 3 = auth
///   [Body: N bytes] - ASCII text
///   [Padding: 2B] - 0x00 0x00
///
/// The codec never touches a socket; ReadResponse() only pulls bytes through ITransport.
class PacketCodec {
public:
    /// Checked Length field for a body of `body_size` bytes
    /// @throws IntegerOverflowError if body_size or body_size + 10 exceeds INT32_MAX
    static int32_t PacketLength(size_t body_size);

    /// Encode a packet to bytes
    /// @throws IntegerOverflowError before anything is built if the body is too large
    static Bytes Encode(const uint8_t* body, size_t body_size, int32_t type, int32_t request_id);

    /// Encode a packet with a text body
    static Bytes Encode(const std::string& body, int32_t type, int32_t request_id);

    /// Decode the 12-byte header
    /// @throws ProtocolError if fewer than HEADER_SIZE bytes are given
    static PacketHeader DecodeHeader(const uint8_t* data, size_t size);

    /// Build a response from a header and its Size-8 payload bytes, stripping the padding
    /// @throws ProtocolError if the payload length disagrees with the header
    static Response DecodeResponse(const PacketHeader& header, const uint8_t* payload, size_t size);

    /// Read one complete response from a transport: header, then exactly Size-8 bytes
    /// @throws ProtocolError if the Size field is outside [MIN_PACKET_SIZE, MAX_RESPONSE_SIZE]
    /// @throws TransportError on read failure
    static Response ReadResponse(ITransport& transport);
};

} // namespace rcon

#endif // RCON_PACKET_CODEC_HPP
