#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/asio/ip/address.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

enum class upstream_protocol_t {
    UDP,
    TCP
};

class dns_timeout_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Sends one encoded query to one server and returns the raw reply. The
// resolver depends only on this interface so tests can script servers.
class upstream_transport {
public:
    virtual ~upstream_transport() {}

    // Throws dns_timeout_error when no reply arrives within p_limit or the
    // transport's own request timeout, whichever is shorter.
    virtual std::vector<uint8_t>
    exchange(
        const boost::asio::ip::address &p_server,
        const std::vector<uint8_t>     &p_query,
        const upstream_protocol_t       p_protocol,
        const std::chrono::milliseconds p_limit
    ) = 0;
};

class asio_upstream_transport :
    public  upstream_transport,
    private boost::noncopyable
{
public:
    asio_upstream_transport(
        std::shared_ptr<spdlog::logger> p_log,
        const uint16_t                  p_port,
        const std::chrono::milliseconds p_timeout
    );

    ~asio_upstream_transport();

    std::vector<uint8_t>
    exchange(
        const boost::asio::ip::address &p_server,
        const std::vector<uint8_t>     &p_query,
        const upstream_protocol_t       p_protocol,
        const std::chrono::milliseconds p_limit
    ) override;

private:
    std::vector<uint8_t>
    exchange_udp(
        const boost::asio::ip::address             &p_server,
        const std::vector<uint8_t>                 &p_query,
        const std::chrono::steady_clock::time_point p_deadline
    );

    std::vector<uint8_t>
    exchange_tcp(
        const boost::asio::ip::address             &p_server,
        const std::vector<uint8_t>                 &p_query,
        const std::chrono::steady_clock::time_point p_deadline
    );

    const std::shared_ptr<spdlog::logger> m_log;
    const uint16_t                        m_port;
    const std::chrono::milliseconds       m_timeout;
};
