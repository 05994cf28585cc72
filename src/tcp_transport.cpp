#include "tcp_transport.hpp"
#include "asio_include.hpp"
#include "rcon/errors.hpp"
#include "rcon/types.hpp"

#include <iostream>
#include <string>

namespace rcon {
namespace internal {

class TcpTransport::Impl {
public:
    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    asio::ip::tcp::resolver resolver_;

    Impl()
        : io_context_()
        , socket_(io_context_)
        , resolver_(io_context_)
    {}

    ~Impl() {
        if (!socket_.is_open()) {
            return;
        }
        asio_error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        if (ec) {
            std::cerr << "RCON transport close error: " << ec.message() << std::endl;
        }
    }

    void Connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
        std::string target = host + ":" + std::to_string(port);
        asio_error_code result;
        bool completed = false;
        bool timed_out = false;

        // Resolve and connect asynchronously so a single deadline covers both steps
        resolver_.async_resolve(
            host,
            std::to_string(port),
            [this, &result, &completed, &timed_out](const asio_error_code& resolve_error,
                                                    const asio::ip::tcp::resolver::results_type& endpoints) {
                // A resolve finishing after the deadline must not start a connect
                if (timed_out) {
                    return;
                }
                if (resolve_error) {
                    result = resolve_error;
                    completed = true;
                    return;
                }

                asio::async_connect(
                    socket_,
                    endpoints,
                    [&result, &completed](const asio_error_code& connect_error,
                                          const asio::ip::tcp::endpoint&) {
                        result = connect_error;
                        completed = true;
                    }
                );
            }
        );

        io_context_.restart();
        if (timeout.count() > 0) {
            io_context_.run_for(timeout);
        } else {
            io_context_.run();
        }

        if (!completed) {
            // Deadline passed with the operation still pending; cancel and drain its handler
            timed_out = true;
            resolver_.cancel();
            asio_error_code ignored;
            socket_.close(ignored);
            io_context_.restart();
            io_context_.run();
            throw TransportError(error_code::CONNECTION_TIMEOUT,
                                 "Timed out after " + std::to_string(timeout.count()) +
                                 "ms connecting to " + target);
        }

        if (result) {
            asio_error_code ignored;
            socket_.close(ignored);
            throw TransportError(error_code::CONNECTION_FAILED,
                                 "Failed to connect to " + target + ": " + result.message());
        }
    }
};

TcpTransport::TcpTransport()
    : impl_(std::make_unique<Impl>())
{}

TcpTransport::~TcpTransport() = default;

std::unique_ptr<TcpTransport> TcpTransport::Dial(const std::string& host, uint16_t port,
                                                 std::chrono::milliseconds timeout) {
    std::unique_ptr<TcpTransport> transport(new TcpTransport());
    transport->impl_->Connect(host, port, timeout);
    return transport;
}

void TcpTransport::Write(const uint8_t* data, size_t size) {
    if (!impl_->socket_.is_open()) {
        throw TransportError(error_code::CONNECTION_CLOSED, "Transport is closed");
    }

    asio_error_code ec;
    asio::write(impl_->socket_, asio::buffer(data, size), ec);
    if (ec) {
        throw TransportError(error_code::WRITE_FAILED, "Write failed: " + ec.message());
    }
}

void TcpTransport::ReadExact(uint8_t* data, size_t size) {
    if (!impl_->socket_.is_open()) {
        throw TransportError(error_code::CONNECTION_CLOSED, "Transport is closed");
    }

    asio_error_code ec;
    asio::read(impl_->socket_, asio::buffer(data, size), ec);
    if (ec == asio::error::eof) {
        throw TransportError(error_code::CONNECTION_CLOSED, "Connection closed by peer");
    }
    if (ec) {
        throw TransportError(error_code::READ_FAILED, "Read failed: " + ec.message());
    }
}

void TcpTransport::Close() {
    if (!impl_->socket_.is_open()) {
        return;
    }

    // Shutdown fails harmlessly when the peer already reset the connection
    asio_error_code ec;
    impl_->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    impl_->socket_.close(ec);
    if (ec) {
        throw TransportError(error_code::CLOSE_FAILED, "Close failed: " + ec.message());
    }
}

bool TcpTransport::IsOpen() const {
    return impl_->socket_.is_open();
}

} // namespace internal
} // namespace rcon
