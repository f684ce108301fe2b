#include <cassert>
#include <optional>

#include <spdlog/sinks/null_sink.h>

#include "request_handler.hpp"
#include "scripted_servers.hpp"

static std::shared_ptr<spdlog::logger> g_log =
    spdlog::null_logger_mt("request_handler_test");

static dns_cache_config_t
cache_config()
{
    dns_cache_config_t l_config;

    l_config.m_sweep_interval = std::chrono::milliseconds(0);

    return l_config;
}

static dns_record_set_t
example_zone()
{
    dns_record_set_t l_zone = { rr_a("example.com", "93.184.216.34") };

    for (int l_i = 0; l_i < 30; l_i++) {
        l_zone.push_back(dns_resource_record_t {
            .m_name  = dns_name_t::from_string("big.example.com"),
            .m_type  = dns_resource_record_type::TXT,
            .m_class = dns_class::INTERNET,
            .m_ttl   = 300,
            .m_data  = txt_data_t {
                .m_strings = { std::string(100, 'a' + l_i % 26) }
            }
        });
    }

    return l_zone;
}

struct fixture_t {
    fixture_t():
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
    {}

    // root, com and example.com all answer
    void
    populate()
    {
        m_transport.add_server("10.0.0.1", root_server());
        m_transport.add_server("10.0.0.2", referral_server(
            "example.com",
            { "ns1.example.com" },
            { { "ns1.example.com", "10.0.0.3" } }
        ));
        m_transport.add_server(
            "10.0.0.3",
            zone_server("example.com", example_zone())
        );
    }

    dns_cache          m_cache;
    scripted_transport m_transport;
    recursive_resolver m_resolver;
    request_handler    m_handler;
};

static dns_message_t
make_query(
    const std::string             &p_name,
    const dns_resource_record_type p_type,
    const std::optional<uint16_t>  p_edns_size=std::nullopt
) {
    dns_message_t l_query;

    l_query.m_header.m_id                = 0x4242;
    l_query.m_header.m_recursion_desired = true;

    l_query.m_questions.push_back(question(p_name, p_type));

    if (p_edns_size) {
        l_query.m_additional.push_back(dns_resource_record_t {
            .m_name  = dns_name_t(),
            .m_type  = dns_resource_record_type::OPT,
            .m_class = static_cast<dns_class>(*p_edns_size),
            .m_ttl   = 0,
            .m_data  = opaque_data_t()
        });
    }

    return l_query;
}

static dns_message_t
handle(
    fixture_t             &p_fixture,
    const dns_message_t   &p_query,
    const transport_kind_t p_transport=transport_kind_t::UDP
) {
    return dns_decode_message(
        p_fixture.m_handler.handle(dns_encode_message(p_query), p_transport)
    );
}

static void
test_count_mismatch_answered_with_format_error()
{
    fixture_t l_fixture;

    // claims five questions, carries none
    const std::vector<uint8_t> l_packet = {
        0xAB, 0xCD, 0x01, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    };

    const dns_message_t l_reply =
        dns_decode_message(l_fixture.m_handler.handle(l_packet, transport_kind_t::UDP));

    assert(l_reply.m_header.m_id == 0xABCD);
    assert(l_reply.m_header.m_response);
    assert(l_reply.m_header.m_response_code == dns_response_code::FORMERR);
    assert(l_reply.m_questions.empty());
    assert(l_fixture.m_transport.queries() == 0);
}

static void
test_garbage_answered_with_format_error()
{
    fixture_t l_fixture;

    const std::vector<uint8_t> l_packet = { 0x12, 0x34, 0x01 };

    const dns_message_t l_reply =
        dns_decode_message(l_fixture.m_handler.handle(l_packet, transport_kind_t::TCP));

    assert(l_reply.m_header.m_id == 0x1234);
    assert(l_reply.m_header.m_response_code == dns_response_code::FORMERR);
}

static void
test_response_and_multi_question_rejected()
{
    fixture_t l_fixture;

    dns_message_t l_response = make_query("example.com", dns_resource_record_type::A);

    l_response.m_header.m_response = true;

    assert(
        handle(l_fixture, l_response).m_header.m_response_code ==
        dns_response_code::FORMERR
    );

    dns_message_t l_double = make_query("example.com", dns_resource_record_type::A);

    l_double.m_questions.push_back(question("example.org"));

    const dns_message_t l_reply = handle(l_fixture, l_double);

    assert(l_reply.m_header.m_id == 0x4242);
    assert(l_reply.m_header.m_response_code == dns_response_code::FORMERR);
    assert(l_fixture.m_transport.queries() == 0);
}

static void
test_other_opcodes_not_implemented()
{
    fixture_t l_fixture;

    dns_message_t l_query = make_query("example.com", dns_resource_record_type::A);

    l_query.m_header.m_opcode = dns_opcode::STATUS;

    const dns_message_t l_reply = handle(l_fixture, l_query);

    assert(l_reply.m_header.m_response_code == dns_response_code::NOTIMP);
    assert(l_reply.m_questions == l_query.m_questions);
}

static void
test_answer()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const dns_message_t l_query =
        make_query("Example.COM", dns_resource_record_type::A);

    const dns_message_t l_reply = handle(l_fixture, l_query);

    assert(l_reply.m_header.m_id == 0x4242);
    assert(l_reply.m_header.m_response);
    assert(l_reply.m_header.m_recursion_desired);
    assert(l_reply.m_header.m_recursion_available);
    assert(!l_reply.m_header.m_authoritative);
    assert(!l_reply.m_header.m_truncated);
    assert(l_reply.m_header.m_response_code == dns_response_code::NOERROR);
    assert(l_reply.m_questions == l_query.m_questions);
    assert(l_reply.m_answers.size() == 1);
    assert(
        std::get<a_data_t>(l_reply.m_answers[0].m_data).m_address.to_string() ==
        "93.184.216.34"
    );
    assert(l_reply.m_additional.empty());
}

static void
test_name_error_carries_soa()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const dns_message_t l_reply = handle(
        l_fixture,
        make_query("nope.example.com", dns_resource_record_type::A)
    );

    assert(l_reply.m_header.m_response_code == dns_response_code::NXDOMAIN);
    assert(l_reply.m_answers.empty());
    assert(l_reply.m_authority.size() == 1);
    assert(l_reply.m_authority[0].m_type == dns_resource_record_type::SOA);
}

static void
test_empty_answer_carries_soa()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const dns_message_t l_reply = handle(
        l_fixture,
        make_query("example.com", dns_resource_record_type::MX)
    );

    assert(l_reply.m_header.m_response_code == dns_response_code::NOERROR);
    assert(l_reply.m_answers.empty());
    assert(l_reply.m_authority.size() == 1);
}

static void
test_resolution_failure_is_servfail()
{
    fixture_t l_fixture;

    // no servers registered, the root never answers
    const dns_message_t l_reply = handle(
        l_fixture,
        make_query("example.com", dns_resource_record_type::A)
    );

    assert(l_reply.m_header.m_id == 0x4242);
    assert(l_reply.m_header.m_response_code == dns_response_code::SERVFAIL);
    assert(l_reply.m_answers.empty());
}

static void
test_udp_reply_truncated()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const dns_message_t l_query =
        make_query("big.example.com", dns_resource_record_type::TXT);

    const std::vector<uint8_t> l_udp =
        l_fixture.m_handler.handle(dns_encode_message(l_query), transport_kind_t::UDP);

    assert(l_udp.size() <= g_dns_udp_max_size);

    const dns_message_t l_udp_reply = dns_decode_message(l_udp);

    assert(l_udp_reply.m_header.m_truncated);
    assert(l_udp_reply.m_questions == l_query.m_questions);
    assert(l_udp_reply.m_answers.size() < 30);

    const dns_message_t l_tcp_reply =
        handle(l_fixture, l_query, transport_kind_t::TCP);

    assert(!l_tcp_reply.m_header.m_truncated);
    assert(l_tcp_reply.m_answers.size() == 30);
}

static void
test_edns_payload_size_honoured()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const dns_message_t l_reply = handle(
        l_fixture,
        make_query("big.example.com", dns_resource_record_type::TXT, 4096)
    );

    assert(!l_reply.m_header.m_truncated);
    assert(l_reply.m_answers.size() == 30);
    assert(l_reply.m_additional.size() == 1);
    assert(l_reply.m_additional[0].m_type == dns_resource_record_type::OPT);
}

static void
test_truncated_edns_reply_keeps_opt()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const std::vector<uint8_t> l_bytes = l_fixture.m_handler.handle(
        dns_encode_message(
            make_query("big.example.com", dns_resource_record_type::TXT, 1232)
        ),
        transport_kind_t::UDP
    );

    assert(l_bytes.size() <= 1232);

    const dns_message_t l_reply = dns_decode_message(l_bytes);

    assert(l_reply.m_header.m_truncated);
    assert(l_reply.m_answers.size() < 30);
    assert(l_reply.m_additional.size() == 1);
    assert(l_reply.m_additional[0].m_type == dns_resource_record_type::OPT);
}

static void
test_cached_path_never_asks_upstream()
{
    fixture_t l_fixture;

    l_fixture.populate();

    const std::vector<uint8_t> l_query = dns_encode_message(
        make_query("example.com", dns_resource_record_type::A)
    );

    assert(!l_fixture.m_handler.handle_cached(l_query, transport_kind_t::UDP));
    assert(l_fixture.m_transport.queries() == 0);

    l_fixture.m_handler.handle(l_query, transport_kind_t::UDP);

    const size_t l_queries = l_fixture.m_transport.queries();

    const std::optional<std::vector<uint8_t>> l_cached =
        l_fixture.m_handler.handle_cached(l_query, transport_kind_t::UDP);

    assert(l_cached.has_value());
    assert(l_fixture.m_transport.queries() == l_queries);

    const dns_message_t l_reply = dns_decode_message(*l_cached);

    assert(l_reply.m_header.m_id == 0x4242);
    assert(l_reply.m_header.m_response_code == dns_response_code::NOERROR);
    assert(l_reply.m_answers.size() == 1);

    // bad input is answered at once as well
    const std::optional<std::vector<uint8_t>> l_garbage =
        l_fixture.m_handler.handle_cached(
            std::vector<uint8_t>({ 0x12, 0x34, 0x01 }),
            transport_kind_t::UDP
        );

    assert(l_garbage.has_value());
    assert(
        dns_decode_message(*l_garbage).m_header.m_response_code ==
        dns_response_code::FORMERR
    );
}

static void
test_reply_budget()
{
    const dns_message_t l_plain =
        make_query("example.com", dns_resource_record_type::A);

    assert(reply_budget(l_plain, transport_kind_t::UDP) == 512);
    assert(reply_budget(l_plain, transport_kind_t::TCP) == 65535);

    assert(reply_budget(
        make_query("example.com", dns_resource_record_type::A, 100),
        transport_kind_t::UDP
    ) == 512);

    assert(reply_budget(
        make_query("example.com", dns_resource_record_type::A, 1232),
        transport_kind_t::UDP
    ) == 1232);

    assert(reply_budget(
        make_query("example.com", dns_resource_record_type::A, 65000),
        transport_kind_t::UDP
    ) == 4096);
}

int
main()
{
    test_count_mismatch_answered_with_format_error();
    test_garbage_answered_with_format_error();
    test_response_and_multi_question_rejected();
    test_other_opcodes_not_implemented();
    test_answer();
    test_name_error_carries_soa();
    test_empty_answer_carries_soa();
    test_resolution_failure_is_servfail();
    test_udp_reply_truncated();
    test_edns_payload_size_honoured();
    test_truncated_edns_reply_keeps_opt();
    test_cached_path_never_asks_upstream();
    test_reply_budget();

    return 0;
}
