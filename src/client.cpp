#include "rcon/client.hpp"
#include "rcon/errors.hpp"
#include "rcon/packet_codec.hpp"
#include "tcp_transport.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace rcon {

class Client::Impl {
public:
    ClientConfig config_;
    std::unique_ptr<ITransport> transport_;
    RequestIdCounter request_id_;

    Impl(ClientConfig config, std::unique_ptr<ITransport> transport)
        : config_(std::move(config))
        , transport_(std::move(transport))
        , request_id_(config_.request_id_cap)
    {}

    void EnsureConnected() const {
        if (!transport_) {
            throw NotConnectedError();
        }
    }

    void EnsureDisconnected(const char* what) const {
        if (transport_) {
            throw std::logic_error(std::string("Cannot change ") + what + " while connected");
        }
    }

    void Dial() {
        transport_ = internal::TcpTransport::Dial(
            config_.address,
            config_.port,
            std::chrono::milliseconds(config_.connect_timeout_ms)
        );
    }

    void WritePacket(const Bytes& packet) {
        transport_->Write(packet.data(), packet.size());
        // The ID is spent once the packet is on the wire, whatever happens to the reply
        request_id_.Advance();
    }

    Response Exchange(int32_t type, const std::string& body) {
        Bytes packet = PacketCodec::Encode(body, type, request_id_.Current());
        WritePacket(packet);
        return PacketCodec::ReadResponse(*transport_);
    }
};

Client::Client(ClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config), nullptr))
{}

Client::Client(ClientConfig config, std::unique_ptr<ITransport> transport)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(transport)))
{}

Client::~Client() {
    if (!impl_->transport_) {
        return;
    }
    try {
        impl_->transport_->Close();
    } catch (const std::exception& e) {
        std::cerr << "RCON client close error: " << e.what() << std::endl;
    }
}

void Client::Connect(const std::string& password) {
    if (!impl_->transport_) {
        impl_->Dial();
    }

    Response response = impl_->Exchange(packet_type::AUTH, password);
    if (response.IsAuthFailure()) {
        throw AuthenticationFailedError();
    }
}

std::string Client::Command(const std::string& cmd) {
    impl_->EnsureConnected();

    Response response = impl_->Exchange(packet_type::COMMAND, cmd);
    return response.GetBody();
}

void Client::CommandNoResponse(const std::string& cmd) {
    impl_->EnsureConnected();

    Bytes packet = PacketCodec::Encode(cmd, packet_type::COMMAND, impl_->request_id_.Current());
    impl_->WritePacket(packet);
}

void Client::Close() {
    impl_->request_id_.Reset();

    if (!impl_->transport_) {
        return;
    }

    // Detach first so the client is disconnected even if the close itself fails
    std::unique_ptr<ITransport> transport = std::move(impl_->transport_);
    transport->Close();
}

bool Client::IsConnected() const {
    return impl_->transport_ != nullptr;
}

const std::string& Client::GetAddress() const {
    return impl_->config_.address;
}

uint16_t Client::GetPort() const {
    return impl_->config_.port;
}

uint32_t Client::GetTimeout() const {
    return impl_->config_.connect_timeout_ms;
}

int32_t Client::GetCap() const {
    return impl_->request_id_.GetCap();
}

int32_t Client::GetRequestId() const {
    return impl_->request_id_.Current();
}

ITransport* Client::GetTransport() const {
    return impl_->transport_.get();
}

void Client::SetRequestId(int32_t id) {
    impl_->request_id_.Set(id);
}

void Client::SetTimeout(uint32_t timeout_ms) {
    impl_->EnsureDisconnected("timeout");
    impl_->config_.connect_timeout_ms = timeout_ms;
}

void Client::SetCap(int32_t cap) {
    impl_->EnsureDisconnected("request ID cap");
    impl_->request_id_.SetCap(cap);
    impl_->config_.request_id_cap = cap;
}

} // namespace rcon
