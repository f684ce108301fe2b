#include <algorithm>

#include "dns_server.hpp"

dns_server::dns_server(
    std::shared_ptr<spdlog::logger> p_log,
    request_handler                &p_handler,
    const boost::asio::ip::address &p_address,
    const uint16_t                  p_port,
    const size_t                    p_workers
):
    m_log(p_log),
    m_handler(p_handler),
    m_udp_socket(m_service, boost::asio::ip::udp::endpoint(p_address, p_port)),
    m_acceptor(m_service, boost::asio::ip::tcp::endpoint(p_address, p_port)),
    m_udp_buffer(g_dns_tcp_max_size),
    m_workers(std::max<size_t>(p_workers, 1))
{
    m_log->info(
        "listening on {}:{} udp, {}:{} tcp with {} workers",
        udp_endpoint().address().to_string(),
        udp_endpoint().port(),
        tcp_endpoint().address().to_string(),
        tcp_endpoint().port(),
        std::max<size_t>(p_workers, 1)
    );

    m_thread = std::thread(&dns_server::thread, this);
}

dns_server::~dns_server()
{
    m_service.stop();

    m_thread.join();

    // in flight resolutions finish, their replies are discarded
    m_workers.join();

    m_log->info("dns_server destructed");
}

boost::asio::ip::udp::endpoint
dns_server::udp_endpoint() const
{
    return m_udp_socket.local_endpoint();
}

boost::asio::ip::tcp::endpoint
dns_server::tcp_endpoint() const
{
    return m_acceptor.local_endpoint();
}

void
dns_server::receive_udp()
{
    m_udp_socket.async_receive_from(
        boost::asio::buffer(m_udp_buffer),
        m_udp_sender,
        [this](
            const boost::system::error_code p_error,
            const std::size_t               p_length
        ) {
            if (p_error == boost::asio::error::operation_aborted) {
                return;
            }

            if (p_error) {
                m_log->warn("async_receive_from() error {}", p_error.message());

                receive_udp();

                return;
            }

            const boost::asio::ip::udp::endpoint l_sender = m_udp_sender;

            std::optional<std::vector<uint8_t>> l_cached;

            try {
                l_cached = m_handler.handle_cached(
                    std::span<const uint8_t>(m_udp_buffer.data(), p_length),
                    transport_kind_t::UDP
                );
            } catch (const std::exception &p_error) {
                m_log->error("udp query dropped: {}", p_error.what());

                receive_udp();

                return;
            }

            if (l_cached) {
                send_udp(
                    std::make_shared<std::vector<uint8_t>>(std::move(*l_cached)),
                    l_sender
                );

                receive_udp();

                return;
            }

            const auto l_query = std::make_shared<std::vector<uint8_t>>(
                m_udp_buffer.begin(),
                m_udp_buffer.begin() + p_length
            );

            boost::asio::post(m_workers, [this, l_query, l_sender]() {
                std::shared_ptr<std::vector<uint8_t>> l_reply;

                try {
                    l_reply = std::make_shared<std::vector<uint8_t>>(
                        m_handler.handle(*l_query, transport_kind_t::UDP)
                    );
                } catch (const std::exception &p_error) {
                    m_log->error("udp query dropped: {}", p_error.what());

                    return;
                }

                boost::asio::post(m_service, [this, l_reply, l_sender]() {
                    send_udp(l_reply, l_sender);
                });
            });

            receive_udp();
        }
    );
}

void
dns_server::send_udp(
    std::shared_ptr<std::vector<uint8_t>> p_reply,
    const boost::asio::ip::udp::endpoint &p_target
) {
    m_udp_socket.async_send_to(
        boost::asio::buffer(*p_reply),
        p_target,
        [this, p_reply](
            const boost::system::error_code p_error,
            const std::size_t
        ) {
            if (p_error) {
                m_log->warn("async_send_to() error {}", p_error.message());
            }
        }
    );
}

void
dns_server::accept_tcp()
{
    std::shared_ptr<session> l_session = std::make_shared<session>(
        session::key(),
        *this,
        m_log
    );

    m_acceptor.async_accept(
        l_session->get_socket(session::key()),
        [this, l_session] (
            const boost::system::error_code p_error
        ) mutable {
            if (p_error == boost::asio::error::operation_aborted) {
                return;
            }

            if (p_error) {
                m_log->warn("async_accept() error {}", p_error.message());
            } else {
                l_session->start(session::key());
            }

            accept_tcp();
        }
    );
}

void
dns_server::thread()
{
    m_log->trace("dns_server::thread() entry");

    try {
        receive_udp();
        accept_tcp();

        m_service.run();
    } catch (const std::exception &p_err) {
        m_log->error("dns_server::thread() {}", p_err.what());
    }

    m_log->trace("dns_server::thread() exit");
}

dns_server::session::session(
    key                             p_key,
    dns_server                     &p_server,
    std::shared_ptr<spdlog::logger> p_log
):
    m_socket(p_server.m_service),
    m_server(p_server),
    m_log(p_log)
{}

dns_server::session::~session()
{
    m_log->trace("tcp session destructed");
}

void
dns_server::session::start(key p_key)
{
    handle_reads();
}

boost::asio::ip::tcp::socket &
dns_server::session::get_socket(key p_key)
{
    return m_socket;
}

void
dns_server::session::handle_reads()
{
    std::shared_ptr<session> l_self(shared_from_this());

    boost::asio::async_read(
        m_socket,
        boost::asio::buffer(m_prefix, sizeof(m_prefix)),
        [this, l_self](
            const boost::system::error_code p_error,
            const std::size_t
        ) {
            if (p_error) {
                if (p_error != boost::asio::error::eof) {
                    m_log->info("async_read() error {}", p_error.message());
                }

                return;
            }

            m_query.resize((m_prefix[0] << 8) | m_prefix[1]);

            boost::asio::async_read(
                m_socket,
                boost::asio::buffer(m_query),
                [this, l_self](
                    const boost::system::error_code p_error,
                    const std::size_t
                ) {
                    if (p_error) {
                        m_log->info("async_read() error {}", p_error.message());

                        return;
                    }

                    std::optional<std::vector<uint8_t>> l_cached;

                    try {
                        l_cached = m_server.m_handler.handle_cached(
                            m_query,
                            transport_kind_t::TCP
                        );
                    } catch (const std::exception &p_error) {
                        m_log->error("tcp query dropped: {}", p_error.what());

                        return;
                    }

                    if (l_cached) {
                        queue_outgoing(std::make_shared<std::vector<uint8_t>>(
                            std::move(*l_cached)
                        ));

                        handle_reads();

                        return;
                    }

                    const auto l_query =
                        std::make_shared<std::vector<uint8_t>>(m_query);

                    std::weak_ptr<session> l_self_weak(l_self);
                    dns_server *const l_server = &m_server;

                    boost::asio::post(
                        l_server->m_workers,
                        [l_server, l_self_weak, l_query]() {
                            std::shared_ptr<std::vector<uint8_t>> l_reply;

                            try {
                                l_reply = std::make_shared<std::vector<uint8_t>>(
                                    l_server->m_handler.handle(
                                        *l_query,
                                        transport_kind_t::TCP
                                    )
                                );
                            } catch (const std::exception &p_error) {
                                l_server->m_log->error(
                                    "tcp query dropped: {}",
                                    p_error.what()
                                );

                                return;
                            }

                            boost::asio::post(
                                l_server->m_service,
                                [l_self_weak, l_reply]() {
                                    std::shared_ptr<session> l_self =
                                        l_self_weak.lock();

                                    // client went away, the cache still
                                    // holds the answer
                                    if (!l_self) {
                                        return;
                                    }

                                    l_self->queue_outgoing(l_reply);
                                }
                            );
                        }
                    );

                    handle_reads();
                }
            );
        }
    );
}

void
dns_server::session::queue_outgoing(
    std::shared_ptr<std::vector<uint8_t>> p_reply
) {
    auto l_framed = std::make_shared<std::vector<uint8_t>>();

    l_framed->reserve(p_reply->size() + 2);
    l_framed->push_back(static_cast<uint8_t>((p_reply->size() >> 8) & 0xFF));
    l_framed->push_back(static_cast<uint8_t>(p_reply->size() & 0xFF));
    l_framed->insert(l_framed->end(), p_reply->begin(), p_reply->end());

    m_outgoing.push_back(l_framed);

    if (m_outgoing.size() == 1) {
        handle_writes();
    }
}

void
dns_server::session::handle_writes()
{
    std::shared_ptr<session> l_self(shared_from_this());

    if (m_outgoing.empty()) {
        return;
    }

    boost::asio::async_write(
        m_socket,
        boost::asio::buffer(*m_outgoing.front()),
        [this, l_self](
            const boost::system::error_code p_error,
            const std::size_t
        ) {
            if (p_error) {
                m_log->info("async_write() error {}", p_error.message());

                m_outgoing.clear();

                return;
            }

            m_outgoing.pop_front();

            handle_writes();
        }
    );
}
