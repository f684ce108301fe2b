#include <algorithm>
#include <utility>

#include <boost/asio.hpp>

#include "upstream_transport.hpp"

typedef std::chrono::steady_clock::time_point deadline_t;

// Drives p_service until p_done is raised by a completion handler. Pending
// operations are abandoned on timeout and cancelled when their socket closes.
static void
run_until(
    boost::asio::io_service &p_service,
    const deadline_t         p_deadline,
    const bool              &p_done
) {
    p_service.restart();

    while (!p_done) {
        const auto l_now = std::chrono::steady_clock::now();

        if (l_now >= p_deadline) {
            throw dns_timeout_error("upstream request timed out");
        }

        p_service.run_one_for(p_deadline - l_now);
    }
}

static void
check_error(const boost::system::error_code &p_error, const char *const p_what)
{
    if (p_error) {
        throw std::runtime_error(
            std::string(p_what) + " failed: " + p_error.message()
        );
    }
}

asio_upstream_transport::asio_upstream_transport(
    std::shared_ptr<spdlog::logger> p_log,
    const uint16_t                  p_port,
    const std::chrono::milliseconds p_timeout
):
    m_log(p_log),
    m_port(p_port),
    m_timeout(p_timeout)
{}

asio_upstream_transport::~asio_upstream_transport() {}

std::vector<uint8_t>
asio_upstream_transport::exchange(
    const boost::asio::ip::address &p_server,
    const std::vector<uint8_t>     &p_query,
    const upstream_protocol_t       p_protocol,
    const std::chrono::milliseconds p_limit
) {
    if (p_limit.count() <= 0) {
        throw dns_timeout_error("no time left to ask " + p_server.to_string());
    }

    const deadline_t l_deadline =
        std::chrono::steady_clock::now() + std::min(m_timeout, p_limit);

    if (p_protocol == upstream_protocol_t::TCP) {
        return exchange_tcp(p_server, p_query, l_deadline);
    } else {
        return exchange_udp(p_server, p_query, l_deadline);
    }
}

std::vector<uint8_t>
asio_upstream_transport::exchange_udp(
    const boost::asio::ip::address &p_server,
    const std::vector<uint8_t>     &p_query,
    const deadline_t                p_deadline
) {
    using boost::asio::ip::udp;

    boost::asio::io_service l_service;

    udp::socket l_socket(
        l_service,
        udp::endpoint(p_server.is_v4() ? udp::v4() : udp::v6(), 0)
    );

    const udp::endpoint l_target(p_server, m_port);

    l_socket.send_to(boost::asio::buffer(p_query), l_target);

    std::vector<uint8_t> l_buffer(65535);

    // replies from any other source are ignored
    while (true) {
        udp::endpoint             l_sender;
        boost::system::error_code l_error;
        size_t                    l_length = 0;
        bool                      l_done   = false;

        l_socket.async_receive_from(
            boost::asio::buffer(l_buffer),
            l_sender,
            [&](
                const boost::system::error_code p_error,
                const std::size_t               p_length
            ) {
                l_error  = p_error;
                l_length = p_length;
                l_done   = true;
            }
        );

        run_until(l_service, p_deadline, l_done);

        check_error(l_error, "receive_from()");

        if (l_sender == l_target) {
            l_buffer.resize(l_length);

            return l_buffer;
        }

        m_log->warn(
            "ignoring datagram from {} while waiting on {}",
            l_sender.address().to_string(),
            p_server.to_string()
        );
    }
}

std::vector<uint8_t>
asio_upstream_transport::exchange_tcp(
    const boost::asio::ip::address &p_server,
    const std::vector<uint8_t>     &p_query,
    const deadline_t                p_deadline
) {
    using boost::asio::ip::tcp;

    boost::asio::io_service   l_service;
    tcp::socket               l_socket(l_service);
    boost::system::error_code l_error;
    bool                      l_done = false;

    l_socket.async_connect(
        tcp::endpoint(p_server, m_port),
        [&](const boost::system::error_code p_error) {
            l_error = p_error;
            l_done  = true;
        }
    );

    run_until(l_service, p_deadline, l_done);
    check_error(l_error, "connect()");

    std::vector<uint8_t> l_request;

    l_request.push_back(static_cast<uint8_t>((p_query.size() >> 8) & 0xFF));
    l_request.push_back(static_cast<uint8_t>(p_query.size() & 0xFF));
    l_request.insert(l_request.end(), p_query.begin(), p_query.end());

    l_done = false;

    boost::asio::async_write(
        l_socket,
        boost::asio::buffer(l_request),
        [&](const boost::system::error_code p_error, const std::size_t) {
            l_error = p_error;
            l_done  = true;
        }
    );

    run_until(l_service, p_deadline, l_done);
    check_error(l_error, "write()");

    uint8_t l_prefix[2];

    l_done = false;

    boost::asio::async_read(
        l_socket,
        boost::asio::buffer(l_prefix, sizeof(l_prefix)),
        [&](const boost::system::error_code p_error, const std::size_t) {
            l_error = p_error;
            l_done  = true;
        }
    );

    run_until(l_service, p_deadline, l_done);
    check_error(l_error, "read() length");

    std::vector<uint8_t> l_response((l_prefix[0] << 8) | l_prefix[1]);

    l_done = false;

    boost::asio::async_read(
        l_socket,
        boost::asio::buffer(l_response),
        [&](const boost::system::error_code p_error, const std::size_t) {
            l_error = p_error;
            l_done  = true;
        }
    );

    run_until(l_service, p_deadline, l_done);
    check_error(l_error, "read() message");

    return l_response;
}
