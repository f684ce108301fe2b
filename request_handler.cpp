#include <algorithm>

#include "request_handler.hpp"

static const dns_resource_record_t *
find_opt(const dns_message_t &p_message)
{
    for (const auto &l_record : p_message.m_additional) {
        if (l_record.m_type == dns_resource_record_type::OPT) {
            return &l_record;
        }
    }

    return nullptr;
}

size_t
reply_budget(const dns_message_t &p_query, const transport_kind_t p_transport)
{
    if (p_transport == transport_kind_t::TCP) {
        return g_dns_tcp_max_size;
    }

    const dns_resource_record_t *const l_opt = find_opt(p_query);

    if (l_opt == nullptr) {
        return g_dns_udp_max_size;
    }

    // the OPT class field carries the requestor's UDP payload size
    return std::clamp<size_t>(
        static_cast<uint16_t>(l_opt->m_class),
        g_dns_udp_max_size,
        g_edns_max_payload_size
    );
}

request_handler::request_handler(
    std::shared_ptr<spdlog::logger> p_log,
    recursive_resolver             &p_resolver
):
    m_log(p_log),
    m_resolver(p_resolver)
{}

request_handler::~request_handler() {}

std::optional<dns_message_t>
request_handler::validate(
    const std::span<const uint8_t> p_query,
    std::vector<uint8_t>          &p_reply
) {
    dns_message_t l_query;

    try {
        l_query = dns_decode_message(p_query);
    } catch (const dns_format_error &p_error) {
        m_log->warn(
            "malformed query ({}): {}",
            dns_format_error_to_string(p_error.kind()),
            p_error.what()
        );

        p_reply = error_reply(
            dns_peek_id(p_query),
            dns_response_code::FORMERR,
            nullptr
        );

        return std::nullopt;
    }

    if (l_query.m_header.m_response || l_query.m_questions.size() != 1) {
        m_log->warn(
            "rejecting query id {} with {} questions",
            l_query.m_header.m_id,
            l_query.m_questions.size()
        );

        p_reply = error_reply(
            l_query.m_header.m_id,
            dns_response_code::FORMERR,
            nullptr
        );

        return std::nullopt;
    }

    if (l_query.m_header.m_opcode != dns_opcode::QUERY) {
        p_reply = error_reply(
            l_query.m_header.m_id,
            dns_response_code::NOTIMP,
            &l_query
        );

        return std::nullopt;
    }

    return l_query;
}

std::vector<uint8_t>
request_handler::handle(
    const std::span<const uint8_t> p_query,
    const transport_kind_t         p_transport
) {
    std::vector<uint8_t>               l_reply;
    const std::optional<dns_message_t> l_query = validate(p_query, l_reply);

    if (!l_query) {
        return l_reply;
    }

    const dns_question_t &l_question = l_query->m_questions.front();

    m_log->trace(
        "query id {} {} {} {}",
        l_query->m_header.m_id,
        l_question.m_name.to_string(),
        dns_class_to_string(l_question.m_class),
        dns_type_to_string(l_question.m_type)
    );

    try {
        return build_reply(
            *l_query,
            m_resolver.resolve(l_question),
            reply_budget(*l_query, p_transport)
        );
    } catch (const std::exception &p_error) {
        m_log->error(
            "failed to answer {}: {}",
            l_question.m_name.to_string(),
            p_error.what()
        );

        return error_reply(
            l_query->m_header.m_id,
            dns_response_code::SERVFAIL,
            &*l_query
        );
    }
}

std::optional<std::vector<uint8_t>>
request_handler::handle_cached(
    const std::span<const uint8_t> p_query,
    const transport_kind_t         p_transport
) {
    std::vector<uint8_t>               l_reply;
    const std::optional<dns_message_t> l_query = validate(p_query, l_reply);

    if (!l_query) {
        return l_reply;
    }

    try {
        const std::optional<resolve_result_t> l_result =
            m_resolver.resolve_cached(l_query->m_questions.front());

        if (!l_result) {
            return std::nullopt;
        }

        return build_reply(
            *l_query,
            *l_result,
            reply_budget(*l_query, p_transport)
        );
    } catch (const std::exception &p_error) {
        m_log->error(
            "failed to answer {} from cache: {}",
            l_query->m_questions.front().m_name.to_string(),
            p_error.what()
        );

        return error_reply(
            l_query->m_header.m_id,
            dns_response_code::SERVFAIL,
            &*l_query
        );
    }
}

std::vector<uint8_t>
request_handler::build_reply(
    const dns_message_t    &p_query,
    const resolve_result_t &p_result,
    const size_t            p_budget
) {
    const dns_question_t &l_question = p_query.m_questions.front();

    dns_message_t l_reply;

    l_reply.m_header.m_id                  = p_query.m_header.m_id;
    l_reply.m_header.m_response            = true;
    l_reply.m_header.m_opcode              = dns_opcode::QUERY;
    l_reply.m_header.m_recursion_desired   = p_query.m_header.m_recursion_desired;
    l_reply.m_header.m_recursion_available = true;
    l_reply.m_questions                    = p_query.m_questions;

    switch (p_result.m_status) {
        case resolution_status_t::RESOLVED:
            l_reply.m_header.m_response_code = dns_response_code::NOERROR;
            l_reply.m_answers   = p_result.m_answers;
            l_reply.m_authority = p_result.m_authority;

            break;
        case resolution_status_t::NAME_ERROR:
            l_reply.m_header.m_response_code = dns_response_code::NXDOMAIN;
            l_reply.m_answers   = p_result.m_answers;
            l_reply.m_authority = p_result.m_authority;

            break;
        default:
            m_log->warn(
                "{} {} failed: {}",
                l_question.m_name.to_string(),
                dns_type_to_string(l_question.m_type),
                resolution_status_to_string(p_result.m_status)
            );

            l_reply.m_header.m_response_code = dns_response_code::SERVFAIL;

            break;
    }

    if (find_opt(p_query) != nullptr) {
        l_reply.m_additional.push_back(dns_resource_record_t {
            .m_name  = dns_name_t(),
            .m_type  = dns_resource_record_type::OPT,
            .m_class = static_cast<dns_class>(g_edns_max_payload_size),
            .m_ttl   = 0,
            .m_data  = opaque_data_t()
        });
    }

    return dns_encode_message(l_reply, p_budget);
}

std::vector<uint8_t>
request_handler::error_reply(
    const uint16_t          p_id,
    const dns_response_code p_code,
    const dns_message_t    *p_query
) {
    dns_message_t l_reply;

    l_reply.m_header.m_id                  = p_id;
    l_reply.m_header.m_response            = true;
    l_reply.m_header.m_recursion_available = true;
    l_reply.m_header.m_response_code       = p_code;

    if (p_query != nullptr) {
        l_reply.m_header.m_opcode            = p_query->m_header.m_opcode;
        l_reply.m_header.m_recursion_desired =
            p_query->m_header.m_recursion_desired;
        l_reply.m_questions                  = p_query->m_questions;
    }

    return dns_encode_message(l_reply, g_dns_udp_max_size);
}
