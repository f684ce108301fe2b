#include <cassert>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <spdlog/sinks/null_sink.h>

#include "dns_server.hpp"
#include "scripted_servers.hpp"

static std::shared_ptr<spdlog::logger> g_log =
    spdlog::null_logger_mt("dns_server_test");

struct fixture_t {
    fixture_t(const size_t p_workers=2):
        m_cache(g_log, cache_config()),
        m_resolver(
            g_log,
            m_cache,
            m_transport,
            resolver_config_t(),
            {
                root_hint_t {
                    .m_name    = dns_name_t::from_string("a.root-servers.net"),
                    .m_address = boost::asio::ip::make_address("10.0.0.1")
                }
            }
        ),
        m_handler(g_log, m_resolver)
    {
        m_transport.add_server("10.0.0.1", root_server());
        m_transport.add_server("10.0.0.2", referral_server(
            "example.com",
            { "ns1.example.com" },
            { { "ns1.example.com", "10.0.0.3" } }
        ));
        m_transport.add_server("10.0.0.3", zone_server(
            "example.com",
            { rr_a("www.example.com", "192.0.2.80") }
        ));

        // the net servers never answer in time
        m_transport.add_server(
            "10.0.0.5",
            [](const dns_message_t &) -> dns_message_t {
                std::this_thread::sleep_for(std::chrono::seconds(1));

                throw dns_timeout_error("no reply");
            }
        );

        m_server = std::make_unique<dns_server>(
            g_log,
            m_handler,
            boost::asio::ip::make_address("127.0.0.1"),
            0,
            p_workers
        );
    }

    static dns_cache_config_t
    cache_config()
    {
        dns_cache_config_t l_config;

        l_config.m_sweep_interval = std::chrono::milliseconds(0);

        return l_config;
    }

    dns_cache                   m_cache;
    scripted_transport          m_transport;
    recursive_resolver          m_resolver;
    request_handler             m_handler;
    std::unique_ptr<dns_server> m_server;
};

static std::vector<uint8_t>
make_query(const uint16_t p_id, const std::string &p_name="www.example.com")
{
    dns_message_t l_query;

    l_query.m_header.m_id                = p_id;
    l_query.m_header.m_recursion_desired = true;

    l_query.m_questions.push_back(question(p_name));

    return dns_encode_message(l_query);
}

static void
check_reply(const dns_message_t &p_reply, const uint16_t p_id)
{
    assert(p_reply.m_header.m_id == p_id);
    assert(p_reply.m_header.m_response);
    assert(p_reply.m_header.m_response_code == dns_response_code::NOERROR);
    assert(p_reply.m_answers.size() == 1);
    assert(
        std::get<a_data_t>(p_reply.m_answers[0].m_data).m_address.to_string() ==
        "192.0.2.80"
    );
}

static void
test_udp_query()
{
    fixture_t                    l_fixture;
    boost::asio::io_service      l_service;
    boost::asio::ip::udp::socket l_socket(l_service);

    l_socket.open(boost::asio::ip::udp::v4());

    l_socket.send_to(
        boost::asio::buffer(make_query(0x1111)),
        l_fixture.m_server->udp_endpoint()
    );

    std::vector<uint8_t>           l_buffer(g_dns_udp_max_size);
    boost::asio::ip::udp::endpoint l_from;

    const size_t l_length =
        l_socket.receive_from(boost::asio::buffer(l_buffer), l_from);

    l_buffer.resize(l_length);

    assert(l_from == l_fixture.m_server->udp_endpoint());

    check_reply(dns_decode_message(l_buffer), 0x1111);
}

static std::vector<uint8_t>
read_framed(boost::asio::ip::tcp::socket &p_socket)
{
    uint8_t l_prefix[2];

    boost::asio::read(p_socket, boost::asio::buffer(l_prefix));

    std::vector<uint8_t> l_body((l_prefix[0] << 8) | l_prefix[1]);

    boost::asio::read(p_socket, boost::asio::buffer(l_body));

    return l_body;
}

static void
write_framed(
    boost::asio::ip::tcp::socket &p_socket,
    const std::vector<uint8_t>   &p_body
) {
    std::vector<uint8_t> l_framed = {
        static_cast<uint8_t>(p_body.size() >> 8),
        static_cast<uint8_t>(p_body.size() & 0xFF)
    };

    l_framed.insert(l_framed.end(), p_body.begin(), p_body.end());

    boost::asio::write(p_socket, boost::asio::buffer(l_framed));
}

static void
test_tcp_queries_share_connection()
{
    fixture_t                    l_fixture;
    boost::asio::io_service      l_service;
    boost::asio::ip::tcp::socket l_socket(l_service);

    l_socket.connect(l_fixture.m_server->tcp_endpoint());

    write_framed(l_socket, make_query(0x2222));

    check_reply(dns_decode_message(read_framed(l_socket)), 0x2222);

    write_framed(l_socket, make_query(0x3333));

    check_reply(dns_decode_message(read_framed(l_socket)), 0x3333);

    // the second query is served from cache
    assert(l_fixture.m_transport.queries() == 3);
}

static void
test_tcp_client_gone_before_reply()
{
    fixture_t l_fixture;

    {
        boost::asio::io_service      l_service;
        boost::asio::ip::tcp::socket l_socket(l_service);

        l_socket.connect(l_fixture.m_server->tcp_endpoint());

        write_framed(l_socket, make_query(0x4444));
    }

    // the server keeps serving other clients
    boost::asio::io_service      l_service;
    boost::asio::ip::tcp::socket l_socket(l_service);

    l_socket.connect(l_fixture.m_server->tcp_endpoint());

    write_framed(l_socket, make_query(0x5555));

    check_reply(dns_decode_message(read_framed(l_socket)), 0x5555);
}

static void
test_cached_answer_not_delayed_by_slow_upstreams()
{
    fixture_t                    l_fixture(2);
    boost::asio::io_service      l_service;
    boost::asio::ip::udp::socket l_socket(l_service);

    l_socket.open(boost::asio::ip::udp::v4());

    std::vector<uint8_t>           l_buffer(g_dns_udp_max_size);
    boost::asio::ip::udp::endpoint l_from;

    l_socket.send_to(
        boost::asio::buffer(make_query(0x6666)),
        l_fixture.m_server->udp_endpoint()
    );

    l_socket.receive_from(boost::asio::buffer(l_buffer), l_from);

    const size_t l_queries = l_fixture.m_transport.queries();

    // one more slow resolution than there are workers
    for (uint16_t l_i = 0; l_i < 3; l_i++) {
        l_socket.send_to(
            boost::asio::buffer(make_query(
                0x7000 + l_i,
                "host" + std::to_string(l_i) + ".example.net"
            )),
            l_fixture.m_server->udp_endpoint()
        );
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto l_start = std::chrono::steady_clock::now();

    l_socket.send_to(
        boost::asio::buffer(make_query(0x8888)),
        l_fixture.m_server->udp_endpoint()
    );

    l_buffer.resize(g_dns_udp_max_size);

    const size_t l_length =
        l_socket.receive_from(boost::asio::buffer(l_buffer), l_from);

    assert(std::chrono::steady_clock::now() - l_start < std::chrono::milliseconds(500));

    l_buffer.resize(l_length);

    // the first reply to arrive is the cached one
    check_reply(dns_decode_message(l_buffer), 0x8888);

    assert(l_fixture.m_transport.queries() > l_queries);
}

int
main()
{
    test_udp_query();
    test_tcp_queries_share_connection();
    test_tcp_client_gone_before_reply();
    test_cached_answer_not_delayed_by_slow_upstreams();

    return 0;
}
