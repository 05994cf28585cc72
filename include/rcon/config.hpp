#ifndef RCON_CONFIG_HPP
#define RCON_CONFIG_HPP

#include "types.hpp"

#include <cstdint>
#include <string>

namespace rcon {

/// Configuration for the Client
struct ClientConfig {
    /// Server hostname or IP address
    std::string address;

    /// Server RCON port (default: 61695)
    uint16_t port = protocol::DEFAULT_PORT;

    /// Dial timeout in milliseconds (default: 10s)
    uint32_t connect_timeout_ms = protocol::DEFAULT_TIMEOUT_MS;

    /// Highest request ID before the counter wraps back to 1 (default: 100)
    int32_t request_id_cap = protocol::DEFAULT_CAP;
};

} // namespace rcon

#endif // RCON_CONFIG_HPP
