#include "rcon/packet_codec.hpp"
#include "rcon/errors.hpp"
#include "endian_utils.hpp"

#include <limits>
#include <string>
#include <utility>

namespace rcon {

using internal::ReadInt32LE;
using internal::WriteInt32LE;

int32_t PacketCodec::PacketLength(size_t body_size) {
    constexpr size_t max_int32 = static_cast<size_t>(std::numeric_limits<int32_t>::max());

    if (body_size > max_int32) {
        throw IntegerOverflowError("Body size " + std::to_string(body_size) +
                                   " exceeds int32 range");
    }
    if (body_size > max_int32 - protocol::LENGTH_OVERHEAD) {
        throw IntegerOverflowError("Packet length for body size " + std::to_string(body_size) +
                                   " exceeds int32 range");
    }
    return static_cast<int32_t>(body_size + protocol::LENGTH_OVERHEAD);
}

Bytes PacketCodec::Encode(const uint8_t* body, size_t body_size, int32_t type, int32_t request_id) {
    // Validate first so an oversized body never allocates or copies
    int32_t length = PacketLength(body_size);

    Bytes buffer;
    buffer.reserve(4 + static_cast<size_t>(length));

    WriteInt32LE(buffer, length);
    WriteInt32LE(buffer, request_id);
    WriteInt32LE(buffer, type);

    if (body_size > 0) {
        buffer.insert(buffer.end(), body, body + body_size);
    }

    // Padding
    buffer.push_back(0x00);
    buffer.push_back(0x00);

    return buffer;
}

Bytes PacketCodec::Encode(const std::string& body, int32_t type, int32_t request_id) {
    return Encode(reinterpret_cast<const uint8_t*>(body.data()), body.size(), type, request_id);
}

PacketHeader PacketCodec::DecodeHeader(const uint8_t* data, size_t size) {
    if (size < protocol::HEADER_SIZE) {
        throw ProtocolError("Incomplete header: " + std::to_string(size) + " bytes");
    }

    PacketHeader header;
    header.size = ReadInt32LE(data);
    header.request_id = ReadInt32LE(data + 4);
    header.type = ReadInt32LE(data + 8);
    return header;
}

Response PacketCodec::DecodeResponse(const PacketHeader& header, const uint8_t* payload, size_t size) {
    if (header.size < protocol::MIN_PACKET_SIZE) {
        throw ProtocolError("Invalid packet size: " + std::to_string(header.size));
    }

    // Size counts RequestId and Type, which are already in the header
    size_t expected = static_cast<size_t>(header.size) - 8;
    if (size != expected) {
        throw ProtocolError("Payload is " + std::to_string(size) + " bytes, header declares " +
                            std::to_string(expected));
    }

    size_t body_size = size - protocol::PADDING_SIZE;
    std::string body(reinterpret_cast<const char*>(payload), body_size);
    return Response(header.request_id, header.type, std::move(body));
}

Response PacketCodec::ReadResponse(ITransport& transport) {
    uint8_t header_bytes[protocol::HEADER_SIZE];
    transport.ReadExact(header_bytes, sizeof(header_bytes));

    PacketHeader header = DecodeHeader(header_bytes, sizeof(header_bytes));
    if (header.size < protocol::MIN_PACKET_SIZE || header.size > protocol::MAX_RESPONSE_SIZE) {
        throw ProtocolError("Invalid packet size: " + std::to_string(header.size));
    }

    Bytes payload(static_cast<size_t>(header.size) - 8);
    transport.ReadExact(payload.data(), payload.size());

    return DecodeResponse(header, payload.data(), payload.size());
}

} // namespace rcon
