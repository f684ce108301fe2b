#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "request_handler.hpp"

// Listens for queries over UDP and TCP. Sockets are serviced by a single I/O
// thread which also answers anything the cache can. Queries needing upstream
// servers are resolved on a pool of workers.
class dns_server : private boost::noncopyable {
public:
    class session :
        public  std::enable_shared_from_this<session>,
        private boost::noncopyable
    {
    public:
        // limited friend access
        class key {
        private:
            friend class dns_server;

            key() = default;
        };

        session(
            key                             p_key,
            dns_server                     &p_server,
            std::shared_ptr<spdlog::logger> p_log
        );

        ~session();

        void start(key p_key);

        boost::asio::ip::tcp::socket &get_socket(key p_key);

    private:
        void handle_reads();
        void handle_writes();
        void queue_outgoing(std::shared_ptr<std::vector<uint8_t>> p_reply);

        boost::asio::ip::tcp::socket                      m_socket;
        dns_server                                       &m_server;
        const std::shared_ptr<spdlog::logger>             m_log;
        uint8_t                                           m_prefix[2];
        std::vector<uint8_t>                              m_query;
        std::deque<std::shared_ptr<std::vector<uint8_t>>> m_outgoing;
    };

    dns_server(
        std::shared_ptr<spdlog::logger> p_log,
        request_handler                &p_handler,
        const boost::asio::ip::address &p_address,
        const uint16_t                  p_port,
        const size_t                    p_workers
    );

    ~dns_server();

    boost::asio::ip::udp::endpoint udp_endpoint() const;

    boost::asio::ip::tcp::endpoint tcp_endpoint() const;

private:
    void receive_udp();

    void
    send_udp(
        std::shared_ptr<std::vector<uint8_t>> p_reply,
        const boost::asio::ip::udp::endpoint &p_target
    );

    void accept_tcp();
    void thread();

    const std::shared_ptr<spdlog::logger> m_log;
    request_handler                      &m_handler;

    boost::asio::io_service        m_service;
    boost::asio::ip::udp::socket   m_udp_socket;
    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::ip::udp::endpoint m_udp_sender;
    std::vector<uint8_t>           m_udp_buffer;
    boost::asio::thread_pool       m_workers;
    std::thread                    m_thread;
};
