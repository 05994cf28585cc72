#ifndef RCON_REQUEST_ID_HPP
#define RCON_REQUEST_ID_HPP

#include "types.hpp"

#include <cstdint>

namespace rcon {

/// Request ID counter owned by one client
/// Holds RESET_ID <= value <= cap. Advance() is called once per packet written
/// and wraps the value back to RESET_ID after it passes the cap.
class RequestIdCounter {
public:
    /// @throws std::invalid_argument if cap < RESET_ID
    explicit RequestIdCounter(int32_t cap = protocol::DEFAULT_CAP);

    int32_t Current() const { return current_; }
    int32_t GetCap() const { return cap_; }

    /// Move to the next ID, wrapping to RESET_ID past the cap
    void Advance();

    /// Return to RESET_ID
    void Reset();

    /// @throws std::invalid_argument if id is outside [RESET_ID, cap]
    void Set(int32_t id);

    /// Change the cap; a current value above the new cap wraps to RESET_ID
    /// @throws std::invalid_argument if cap < RESET_ID
    void SetCap(int32_t cap);

private:
    int32_t cap_;
    int32_t current_;
};

} // namespace rcon

#endif // RCON_REQUEST_ID_HPP
