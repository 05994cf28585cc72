#include "rcon/response.hpp"
#include <utility>

namespace rcon {

Response::Response(int32_t request_id, int32_t type, std::string body)
    : request_id_(request_id)
    , type_(type)
    , body_(std::move(body))
{}

int32_t Response::GetRequestId() const {
    return request_id_;
}

int32_t Response::GetType() const {
    return type_;
}

const std::string& Response::GetBody() const {
    return body_;
}

bool Response::IsAuthFailure() const {
    return request_id_ == protocol::AUTH_FAILED_ID;
}

} // namespace rcon
