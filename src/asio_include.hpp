#ifndef RCON_ASIO_INCLUDE_HPP
#define RCON_ASIO_INCLUDE_HPP

// This header provides a unified way to include ASIO headers
// Supports both standalone ASIO and Boost.Asio

#include <utility> // std::exchange, needed by some asio versions under C++20

#if defined(RCON_USE_BOOST_ASIO)
    // Boost.Asio
    #include <boost/asio.hpp>
    #include <boost/system/system_error.hpp>
    namespace asio = boost::asio;

    namespace rcon {
    namespace internal {
        using asio_error_code = boost::system::error_code;
    } // namespace internal
    } // namespace rcon
#else
    // Default to standalone ASIO
    #ifndef ASIO_STANDALONE
        #define ASIO_STANDALONE
    #endif
    #include <asio.hpp>

    namespace rcon {
    namespace internal {
        using asio_error_code = asio::error_code;
    } // namespace internal
    } // namespace rcon
#endif

#endif // RCON_ASIO_INCLUDE_HPP
