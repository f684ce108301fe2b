#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/asio/ip/address.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "dns_cache.hpp"
#include "dns_codec.hpp"
#include "upstream_transport.hpp"

enum class resolution_status_t {
    RESOLVED,
    NAME_ERROR,
    SERVER_FAILURE,
    LOOP_DETECTED,
    TOO_MANY_REDIRECTIONS,
    TIMEOUT
};

std::string resolution_status_to_string(const resolution_status_t p_status);

struct resolve_result_t {
    resolution_status_t m_status = resolution_status_t::SERVER_FAILURE;
    // CNAME records followed, then the records answering the final name
    dns_record_set_t    m_answers;
    // SOA backing a NAME_ERROR or an empty answer
    dns_record_set_t    m_authority;
};

class dns_protocol_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct root_hint_t {
    dns_name_t               m_name;
    boost::asio::ip::address m_address;
};

struct resolver_config_t {
    unsigned int              m_max_depth          = 8;
    std::chrono::milliseconds m_resolution_timeout = std::chrono::seconds(10);
};

class recursive_resolver : private boost::noncopyable {
public:
    recursive_resolver(
        std::shared_ptr<spdlog::logger> p_log,
        dns_cache                      &p_cache,
        upstream_transport             &p_transport,
        const resolver_config_t        &p_config,
        std::vector<root_hint_t>        p_root_hints
    );

    ~recursive_resolver();

    // Concurrent calls for the same question share a single walk.
    resolve_result_t resolve(const dns_question_t &p_question);

    // Answers from the cache alone, following cached aliases. Returns nullopt
    // when any upstream server would have to be asked.
    std::optional<resolve_result_t>
    resolve_cached(const dns_question_t &p_question);

private:
    enum class lookup_state_t {
        START,
        QUERYING_SERVER,
        FOLLOWING_CNAME,
        FOLLOWING_DELEGATION,
        RESOLVED,
        FAILED
    };

    struct delegation_t {
        dns_name_t                            m_zone;
        dns_record_set_t                      m_nameservers;
        dns_record_set_t                      m_glue;
        std::vector<boost::asio::ip::address> m_addresses;
        std::vector<dns_name_t>               m_glueless;
    };

    // One name being chased. Nameserver address lookups push another frame.
    struct lookup_frame_t {
        dns_name_t                            m_name;
        dns_resource_record_type              m_type;
        dns_class                             m_class;
        lookup_state_t                        m_state = lookup_state_t::START;
        std::unordered_set<dns_name_t, dns_name_t::hasher> m_visited;
        dns_record_set_t                      m_chain;
        dns_name_t                            m_zone;
        std::vector<boost::asio::ip::address> m_servers;
        size_t                                m_next_server = 0;
        std::vector<dns_name_t>               m_glueless;
        size_t                                m_next_glueless = 0;
        std::optional<dns_resource_record_t>  m_cname;
        std::optional<delegation_t>           m_delegation;
        resolve_result_t                      m_result;
    };

    // state shared by every frame of one resolution
    struct resolution_context_t {
        unsigned int                                       m_depth;
        std::chrono::steady_clock::time_point              m_deadline;
        std::unordered_set<dns_name_t, dns_name_t::hasher> m_nameserver_lookups;
    };

    resolve_result_t walk(const dns_question_t &p_question);

    std::optional<dns_name_t>
    advance(resolution_context_t &p_context, lookup_frame_t &p_frame);

    void start(lookup_frame_t &p_frame);

    // finishes the frame or moves it to FOLLOWING_CNAME when the cache can
    bool answer_from_cache(lookup_frame_t &p_frame);

    std::optional<dns_name_t>
    query_next_server(resolution_context_t &p_context, lookup_frame_t &p_frame);

    void
    handle_response(
        resolution_context_t &p_context,
        lookup_frame_t       &p_frame,
        const dns_message_t  &p_response
    );

    void follow_cname(resolution_context_t &p_context, lookup_frame_t &p_frame);

    // Follows the aliases of p_answers starting at the frame's name. Returns
    // false when a loop or the depth bound ended the frame.
    bool
    follow_answer_cnames(
        resolution_context_t   &p_context,
        lookup_frame_t         &p_frame,
        const dns_record_set_t &p_answers
    );

    void
    follow_delegation(
        resolution_context_t &p_context,
        lookup_frame_t       &p_frame
    );

    std::optional<delegation_t>
    find_delegation(
        const lookup_frame_t &p_frame,
        const dns_message_t  &p_response
    ) const;

    void select_servers(lookup_frame_t &p_frame);

    std::vector<boost::asio::ip::address>
    cached_addresses(const dns_name_t &p_host, const dns_class p_class);

    void
    cache_rrsets(const dns_record_set_t &p_records, const dns_name_t &p_zone);

    dns_message_t
    query_server(
        const resolution_context_t     &p_context,
        const boost::asio::ip::address &p_server,
        const lookup_frame_t           &p_frame
    );

    static void
    finish(
        lookup_frame_t           &p_frame,
        const resolution_status_t p_status,
        const dns_record_set_t   &p_records=dns_record_set_t(),
        const dns_record_set_t   &p_authority=dns_record_set_t()
    );

    const std::shared_ptr<spdlog::logger> m_log;
    dns_cache                            &m_cache;
    upstream_transport                   &m_transport;
    const resolver_config_t               m_config;
    const std::vector<root_hint_t>        m_root_hints;

    std::mutex m_pending_lock;

    std::unordered_map<
        cache_key_t,
        std::shared_future<resolve_result_t>,
        cache_key_t::hasher
    > m_pending;
};
