#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "dns_codec.hpp"
#include "resolver.hpp"

enum class transport_kind_t {
    UDP,
    TCP
};

constexpr size_t g_edns_max_payload_size = 4096;

// Turns one client query into one reply. Never throws for bad input, a
// malformed query is answered with FORMERR.
class request_handler : private boost::noncopyable {
public:
    request_handler(
        std::shared_ptr<spdlog::logger> p_log,
        recursive_resolver             &p_resolver
    );

    ~request_handler();

    std::vector<uint8_t>
    handle(
        const std::span<const uint8_t> p_query,
        const transport_kind_t         p_transport
    );

    // Like handle() but never asks an upstream server. Returns nullopt when
    // the query needs a resolution that the cache cannot complete.
    std::optional<std::vector<uint8_t>>
    handle_cached(
        const std::span<const uint8_t> p_query,
        const transport_kind_t         p_transport
    );

private:
    // Returns the decoded query when it should be resolved, otherwise sets
    // p_reply to the error reply.
    std::optional<dns_message_t>
    validate(
        const std::span<const uint8_t> p_query,
        std::vector<uint8_t>          &p_reply
    );

    std::vector<uint8_t>
    build_reply(
        const dns_message_t    &p_query,
        const resolve_result_t &p_result,
        const size_t            p_budget
    );

    std::vector<uint8_t>
    error_reply(
        const uint16_t          p_id,
        const dns_response_code p_code,
        const dns_message_t    *p_query
    );

    const std::shared_ptr<spdlog::logger> m_log;
    recursive_resolver                   &m_resolver;
};

// largest reply the client accepts over p_transport
size_t
reply_budget(const dns_message_t &p_query, const transport_kind_t p_transport);
