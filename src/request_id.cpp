#include "rcon/request_id.hpp"
#include <stdexcept>
#include <string>

namespace rcon {

namespace {
    void ValidateCap(int32_t cap) {
        if (cap < protocol::RESET_ID) {
            throw std::invalid_argument("Request ID cap must be at least " +
                                        std::to_string(protocol::RESET_ID));
        }
    }
}

RequestIdCounter::RequestIdCounter(int32_t cap)
    : cap_(cap)
    , current_(protocol::RESET_ID)
{
    ValidateCap(cap);
}

void RequestIdCounter::Advance() {
    // Compare before adding so a cap of INT32_MAX cannot overflow
    if (current_ >= cap_) {
        current_ = protocol::RESET_ID;
    } else {
        ++current_;
    }
}

void RequestIdCounter::Reset() {
    current_ = protocol::RESET_ID;
}

void RequestIdCounter::Set(int32_t id) {
    if (id < protocol::RESET_ID || id > cap_) {
        throw std::invalid_argument("Request ID " + std::to_string(id) +
                                    " outside [" + std::to_string(protocol::RESET_ID) +
                                    ", " + std::to_string(cap_) + "]");
    }
    current_ = id;
}

void RequestIdCounter::SetCap(int32_t cap) {
    ValidateCap(cap);
    cap_ = cap;
    if (current_ > cap_) {
        current_ = protocol::RESET_ID;
    }
}

} // namespace rcon
