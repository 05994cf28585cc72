#ifndef RCON_TYPES_HPP
#define RCON_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace rcon {

// Type aliases
using Bytes = std::vector<uint8_t>;

// Packet type values carried in the Type field
namespace packet_type {
    constexpr int32_t RESPONSE_VALUE = 0;
    constexpr int32_t COMMAND = 2;
    constexpr int32_t AUTH_RESPONSE = 2;
    constexpr int32_t AUTH = 3;
}

// Error codes
namespace error_code {
    constexpr int SUCCESS = 0;
    constexpr int CONNECTION_FAILED = 1001;
    constexpr int CONNECTION_TIMEOUT = 1002;
    constexpr int CONNECTION_CLOSED = 1003;
    constexpr int NOT_CONNECTED = 1004;
    constexpr int WRITE_FAILED = 1005;
    constexpr int READ_FAILED = 1006;
    constexpr int CLOSE_FAILED = 1007;
    constexpr int INTEGER_OVERFLOW = 2001;
    constexpr int PROTOCOL_VIOLATION = 2003;
    constexpr int AUTHENTICATION_FAILED = 3001;
}

// Protocol constants
namespace protocol {
    constexpr uint32_t HEADER_SIZE = 12;      // Length(4) + RequestId(4) + Type(4)
    constexpr uint32_t PADDING_SIZE = 2;      // two NUL bytes after the body
    constexpr uint32_t LENGTH_OVERHEAD = 10;  // RequestId(4) + Type(4) + Padding(2)
    constexpr int32_t MIN_PACKET_SIZE = 10;
    constexpr int32_t MAX_RESPONSE_SIZE = 1024 * 1024;

    constexpr int32_t RESET_ID = 1;
    constexpr int32_t AUTH_FAILED_ID = -1;

    constexpr uint16_t DEFAULT_PORT = 61695;
    constexpr uint32_t DEFAULT_TIMEOUT_MS = 10000;
    constexpr int32_t DEFAULT_CAP = 100;
}

} // namespace rcon

#endif // RCON_TYPES_HPP
