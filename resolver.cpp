#include <algorithm>
#include <map>
#include <random>

#include "resolver.hpp"

std::string
resolution_status_to_string(const resolution_status_t p_status)
{
    switch (p_status) {
        case resolution_status_t::RESOLVED:
            return std::string("RESOLVED"); break;
        case resolution_status_t::NAME_ERROR:
            return std::string("NAME_ERROR"); break;
        case resolution_status_t::SERVER_FAILURE:
            return std::string("SERVER_FAILURE"); break;
        case resolution_status_t::LOOP_DETECTED:
            return std::string("LOOP_DETECTED"); break;
        case resolution_status_t::TOO_MANY_REDIRECTIONS:
            return std::string("TOO_MANY_REDIRECTIONS"); break;
        case resolution_status_t::TIMEOUT:
            return std::string("TIMEOUT"); break;
    }

    return std::string("unknown");
}

static uint16_t
generate_query_id()
{
    thread_local std::mt19937 l_engine(std::random_device{}());

    return std::uniform_int_distribution<uint16_t>()(l_engine);
}

static std::optional<dns_resource_record_t>
find_soa(const dns_record_set_t &p_records)
{
    for (const auto &l_record : p_records) {
        if (std::holds_alternative<soa_data_t>(l_record.m_data)) {
            return l_record;
        }
    }

    return std::nullopt;
}

// RFC 2308 section 5, the lesser of the SOA TTL and its minimum field
static uint32_t
negative_ttl(const dns_resource_record_t &p_soa)
{
    return std::min(p_soa.m_ttl, std::get<soa_data_t>(p_soa.m_data).m_minimum);
}

static std::chrono::milliseconds
time_left(const std::chrono::steady_clock::time_point p_deadline)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        p_deadline - std::chrono::steady_clock::now()
    );
}

static std::vector<boost::asio::ip::address>
addresses_of(const dns_record_set_t &p_records, const dns_name_t &p_host)
{
    std::vector<boost::asio::ip::address> l_v4;
    std::vector<boost::asio::ip::address> l_v6;

    for (const auto &l_record : p_records) {
        if (!(l_record.m_name == p_host)) {
            continue;
        }

        if (const auto *l_a = std::get_if<a_data_t>(&l_record.m_data)) {
            l_v4.push_back(l_a->m_address);
        } else if (const auto *l_aaaa = std::get_if<aaaa_data_t>(&l_record.m_data)) {
            l_v6.push_back(l_aaaa->m_address);
        }
    }

    l_v4.insert(l_v4.end(), l_v6.begin(), l_v6.end());

    return l_v4;
}

recursive_resolver::recursive_resolver(
    std::shared_ptr<spdlog::logger> p_log,
    dns_cache                      &p_cache,
    upstream_transport             &p_transport,
    const resolver_config_t        &p_config,
    std::vector<root_hint_t>        p_root_hints
):
    m_log(p_log),
    m_cache(p_cache),
    m_transport(p_transport),
    m_config(p_config),
    m_root_hints(std::move(p_root_hints))
{
    if (m_root_hints.empty()) {
        throw std::runtime_error("resolver needs at least one root hint");
    }
}

recursive_resolver::~recursive_resolver() {}

resolve_result_t
recursive_resolver::resolve(const dns_question_t &p_question)
{
    const cache_key_t l_key = {
        .m_name  = p_question.m_name,
        .m_type  = p_question.m_type,
        .m_class = p_question.m_class
    };

    std::promise<resolve_result_t>       l_promise;
    std::shared_future<resolve_result_t> l_future;

    {
        std::lock_guard<std::mutex> l_guard(m_pending_lock);

        const auto l_iter = m_pending.find(l_key);

        if (l_iter != m_pending.end()) {
            l_future = l_iter->second;
        } else {
            m_pending.emplace(l_key, l_promise.get_future().share());
        }
    }

    if (l_future.valid()) {
        m_log->trace(
            "joining in flight resolution of {} {}",
            p_question.m_name.to_string(),
            dns_type_to_string(p_question.m_type)
        );

        return l_future.get();
    }

    resolve_result_t l_result;

    try {
        l_result = walk(p_question);
    } catch (const std::exception &p_error) {
        m_log->error(
            "resolution of {} failed: {}",
            p_question.m_name.to_string(),
            p_error.what()
        );

        l_result = resolve_result_t {
            .m_status = resolution_status_t::SERVER_FAILURE
        };
    }

    l_promise.set_value(l_result);

    {
        std::lock_guard<std::mutex> l_guard(m_pending_lock);

        m_pending.erase(l_key);
    }

    m_log->debug(
        "resolved {} {} -> {} ({} answers)",
        p_question.m_name.to_string(),
        dns_type_to_string(p_question.m_type),
        resolution_status_to_string(l_result.m_status),
        l_result.m_answers.size()
    );

    return l_result;
}

resolve_result_t
recursive_resolver::walk(const dns_question_t &p_question)
{
    resolution_context_t l_context = {
        .m_depth    = m_config.m_max_depth,
        .m_deadline =
            std::chrono::steady_clock::now() + m_config.m_resolution_timeout,
        .m_nameserver_lookups = {}
    };

    std::vector<lookup_frame_t> l_stack;

    l_stack.push_back(lookup_frame_t {
        .m_name  = p_question.m_name,
        .m_type  = p_question.m_type,
        .m_class = p_question.m_class
    });

    l_stack.back().m_visited.insert(p_question.m_name);

    while (true) {
        const std::optional<dns_name_t> l_nameserver =
            advance(l_context, l_stack.back());

        if (l_nameserver) {
            m_log->trace(
                "looking up address of nameserver {}",
                l_nameserver->to_string()
            );

            l_context.m_nameserver_lookups.insert(*l_nameserver);

            l_stack.push_back(lookup_frame_t {
                .m_name  = *l_nameserver,
                .m_type  = dns_resource_record_type::A,
                .m_class = dns_class::INTERNET
            });

            l_stack.back().m_visited.insert(*l_nameserver);

            continue;
        }

        resolve_result_t l_result = std::move(l_stack.back().m_result);

        const dns_name_t l_finished_name = l_stack.back().m_chain.empty()
            ? l_stack.back().m_name
            : l_stack.back().m_chain.front().m_name;

        l_stack.pop_back();

        if (l_stack.empty()) {
            return l_result;
        }

        l_context.m_nameserver_lookups.erase(l_finished_name);

        // these end the whole resolution, not just the nested lookup
        if (l_result.m_status == resolution_status_t::TIMEOUT ||
            l_result.m_status == resolution_status_t::TOO_MANY_REDIRECTIONS)
        {
            return resolve_result_t { .m_status = l_result.m_status };
        }

        lookup_frame_t &l_parent = l_stack.back();

        std::vector<boost::asio::ip::address> l_addresses;

        for (const auto &l_record : l_result.m_answers) {
            if (const auto *l_a = std::get_if<a_data_t>(&l_record.m_data)) {
                l_addresses.push_back(l_a->m_address);
            }
        }

        if (l_addresses.empty()) {
            m_log->trace(
                "nameserver {} did not resolve: {}",
                l_finished_name.to_string(),
                resolution_status_to_string(l_result.m_status)
            );
        }

        l_parent.m_servers     = l_addresses;
        l_parent.m_next_server = 0;
    }
}

std::optional<dns_name_t>
recursive_resolver::advance(
    resolution_context_t &p_context,
    lookup_frame_t       &p_frame
) {
    while (true) {
        if (p_frame.m_state == lookup_state_t::RESOLVED ||
            p_frame.m_state == lookup_state_t::FAILED)
        {
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() >= p_context.m_deadline) {
            m_log->warn(
                "resolution deadline passed while chasing {}",
                p_frame.m_name.to_string()
            );

            finish(p_frame, resolution_status_t::TIMEOUT);

            return std::nullopt;
        }

        switch (p_frame.m_state) {
            case lookup_state_t::START:
                start(p_frame);

                break;
            case lookup_state_t::QUERYING_SERVER: {
                const std::optional<dns_name_t> l_nameserver =
                    query_next_server(p_context, p_frame);

                if (l_nameserver) {
                    return l_nameserver;
                }

                break;
            }
            case lookup_state_t::FOLLOWING_CNAME:
                follow_cname(p_context, p_frame);

                break;
            case lookup_state_t::FOLLOWING_DELEGATION:
                follow_delegation(p_context, p_frame);

                break;
            case lookup_state_t::RESOLVED:
            case lookup_state_t::FAILED:
                break;
        }
    }
}

std::optional<resolve_result_t>
recursive_resolver::resolve_cached(const dns_question_t &p_question)
{
    resolution_context_t l_context = {
        .m_depth              = m_config.m_max_depth,
        .m_deadline           = std::chrono::steady_clock::time_point::max(),
        .m_nameserver_lookups = {}
    };

    lookup_frame_t l_frame = {
        .m_name  = p_question.m_name,
        .m_type  = p_question.m_type,
        .m_class = p_question.m_class
    };

    l_frame.m_visited.insert(p_question.m_name);

    while (true) {
        if (!answer_from_cache(l_frame)) {
            return std::nullopt;
        }

        if (l_frame.m_state != lookup_state_t::FOLLOWING_CNAME) {
            return l_frame.m_result;
        }

        follow_cname(l_context, l_frame);

        if (l_frame.m_state == lookup_state_t::FAILED) {
            return l_frame.m_result;
        }
    }
}

void
recursive_resolver::start(lookup_frame_t &p_frame)
{
    if (answer_from_cache(p_frame)) {
        return;
    }

    select_servers(p_frame);

    p_frame.m_state = lookup_state_t::QUERYING_SERVER;
}

bool
recursive_resolver::answer_from_cache(lookup_frame_t &p_frame)
{
    const std::optional<cache_hit_t> l_hit = m_cache.lookup(
        p_frame.m_name,
        p_frame.m_type,
        p_frame.m_class
    );

    if (l_hit) {
        m_log->trace(
            "cache hit {} {}",
            p_frame.m_name.to_string(),
            dns_type_to_string(p_frame.m_type)
        );

        if (l_hit->m_negative) {
            finish(
                p_frame,
                resolution_status_t::NAME_ERROR,
                dns_record_set_t(),
                l_hit->m_authority
            );
        } else {
            finish(
                p_frame,
                resolution_status_t::RESOLVED,
                l_hit->m_records,
                l_hit->m_authority
            );
        }

        return true;
    }

    if (p_frame.m_type != dns_resource_record_type::CNAME) {
        const std::optional<cache_hit_t> l_alias = m_cache.lookup(
            p_frame.m_name,
            dns_resource_record_type::CNAME,
            p_frame.m_class
        );

        if (l_alias && !l_alias->m_negative && !l_alias->m_records.empty() &&
            std::holds_alternative<cname_data_t>(
                l_alias->m_records.front().m_data
            ))
        {
            p_frame.m_cname = l_alias->m_records.front();
            p_frame.m_state = lookup_state_t::FOLLOWING_CNAME;

            return true;
        }
    }

    return false;
}

void
recursive_resolver::select_servers(lookup_frame_t &p_frame)
{
    // closest enclosing zone whose nameserver addresses are still cached
    for (dns_name_t l_zone = p_frame.m_name; !l_zone.is_root();
        l_zone = l_zone.parent())
    {
        const std::optional<cache_hit_t> l_hit = m_cache.lookup(
            l_zone,
            dns_resource_record_type::NS,
            p_frame.m_class
        );

        if (!l_hit || l_hit->m_negative) {
            continue;
        }

        std::vector<boost::asio::ip::address> l_addresses;
        std::vector<dns_name_t>               l_glueless;

        for (const auto &l_record : l_hit->m_records) {
            const auto *l_ns = std::get_if<ns_data_t>(&l_record.m_data);

            if (l_ns == nullptr) {
                continue;
            }

            const std::vector<boost::asio::ip::address> l_host_addresses =
                cached_addresses(l_ns->m_host, p_frame.m_class);

            if (l_host_addresses.empty()) {
                l_glueless.push_back(l_ns->m_host);
            } else {
                l_addresses.insert(
                    l_addresses.end(),
                    l_host_addresses.begin(),
                    l_host_addresses.end()
                );
            }
        }

        if (!l_addresses.empty()) {
            m_log->trace(
                "starting {} at cached zone {}",
                p_frame.m_name.to_string(),
                l_zone.to_string()
            );

            p_frame.m_zone          = l_zone;
            p_frame.m_servers       = l_addresses;
            p_frame.m_next_server   = 0;
            p_frame.m_glueless      = l_glueless;
            p_frame.m_next_glueless = 0;

            return;
        }
    }

    p_frame.m_zone = dns_name_t();
    p_frame.m_servers.clear();

    for (const auto &l_hint : m_root_hints) {
        p_frame.m_servers.push_back(l_hint.m_address);
    }

    p_frame.m_next_server   = 0;
    p_frame.m_glueless.clear();
    p_frame.m_next_glueless = 0;
}

std::vector<boost::asio::ip::address>
recursive_resolver::cached_addresses(
    const dns_name_t &p_host,
    const dns_class   p_class
) {
    std::vector<boost::asio::ip::address> l_addresses;

    for (const auto l_type : {
        dns_resource_record_type::A,
        dns_resource_record_type::AAAA
    }) {
        const std::optional<cache_hit_t> l_hit =
            m_cache.lookup(p_host, l_type, p_class);

        if (l_hit && !l_hit->m_negative) {
            const std::vector<boost::asio::ip::address> l_found =
                addresses_of(l_hit->m_records, p_host);

            l_addresses.insert(l_addresses.end(), l_found.begin(), l_found.end());
        }
    }

    return l_addresses;
}

std::optional<dns_name_t>
recursive_resolver::query_next_server(
    resolution_context_t &p_context,
    lookup_frame_t       &p_frame
) {
    if (p_frame.m_next_server >= p_frame.m_servers.size()) {
        while (p_frame.m_next_glueless < p_frame.m_glueless.size()) {
            const dns_name_t l_nameserver =
                p_frame.m_glueless[p_frame.m_next_glueless++];

            if (p_context.m_nameserver_lookups.count(l_nameserver) ||
                p_frame.m_visited.count(l_nameserver))
            {
                continue;
            }

            const std::vector<boost::asio::ip::address> l_addresses =
                cached_addresses(l_nameserver, p_frame.m_class);

            if (!l_addresses.empty()) {
                p_frame.m_servers     = l_addresses;
                p_frame.m_next_server = 0;

                return std::nullopt;
            }

            if (p_context.m_depth == 0) {
                finish(p_frame, resolution_status_t::TOO_MANY_REDIRECTIONS);

                return std::nullopt;
            }

            p_context.m_depth--;

            return l_nameserver;
        }

        m_log->warn(
            "all servers for zone {} failed for {}",
            p_frame.m_zone.to_string(),
            p_frame.m_name.to_string()
        );

        finish(p_frame, resolution_status_t::SERVER_FAILURE);

        return std::nullopt;
    }

    const boost::asio::ip::address l_server =
        p_frame.m_servers[p_frame.m_next_server++];

    m_log->trace(
        "asking {} (zone {}) for {} {}",
        l_server.to_string(),
        p_frame.m_zone.to_string(),
        p_frame.m_name.to_string(),
        dns_type_to_string(p_frame.m_type)
    );

    dns_message_t l_response;

    try {
        l_response = query_server(p_context, l_server, p_frame);
    } catch (const dns_timeout_error &) {
        m_log->warn("server {} timed out", l_server.to_string());

        return std::nullopt;
    } catch (const std::exception &p_error) {
        m_log->warn(
            "server {} unusable: {}",
            l_server.to_string(),
            p_error.what()
        );

        return std::nullopt;
    }

    handle_response(p_context, p_frame, l_response);

    return std::nullopt;
}

dns_message_t
recursive_resolver::query_server(
    const resolution_context_t     &p_context,
    const boost::asio::ip::address &p_server,
    const lookup_frame_t           &p_frame
) {
    dns_message_t l_query;

    l_query.m_header.m_id = generate_query_id();

    l_query.m_questions.push_back(dns_question_t {
        .m_name  = p_frame.m_name,
        .m_type  = p_frame.m_type,
        .m_class = p_frame.m_class
    });

    const std::vector<uint8_t> l_bytes =
        dns_encode_message(l_query, g_dns_udp_max_size);

    dns_message_t l_response = dns_decode_message(
        m_transport.exchange(
            p_server,
            l_bytes,
            upstream_protocol_t::UDP,
            time_left(p_context.m_deadline)
        )
    );

    if (l_response.m_header.m_truncated) {
        m_log->trace("truncated reply from {}, retrying over tcp",
            p_server.to_string());

        l_response = dns_decode_message(
            m_transport.exchange(
                p_server,
                l_bytes,
                upstream_protocol_t::TCP,
                time_left(p_context.m_deadline)
            )
        );
    }

    if (l_response.m_header.m_id != l_query.m_header.m_id) {
        throw dns_protocol_error(
            "reply id " + std::to_string(l_response.m_header.m_id) +
                " does not match query id " +
                std::to_string(l_query.m_header.m_id)
        );
    }

    if (!l_response.m_header.m_response) {
        throw dns_protocol_error("reply does not have the response flag set");
    }

    if (l_response.m_questions.size() != 1 ||
        !(l_response.m_questions.front() == l_query.m_questions.front()))
    {
        throw dns_protocol_error("reply question does not match the query");
    }

    return l_response;
}

void
recursive_resolver::cache_rrsets(
    const dns_record_set_t &p_records,
    const dns_name_t       &p_zone
) {
    std::vector<std::pair<cache_key_t, dns_record_set_t>> l_sets;

    for (const auto &l_record : p_records) {
        // never accept data for names outside the zone being asked
        if (!l_record.m_name.is_subdomain_of(p_zone) ||
            l_record.m_type == dns_resource_record_type::OPT)
        {
            continue;
        }

        const cache_key_t l_key = {
            .m_name  = l_record.m_name,
            .m_type  = l_record.m_type,
            .m_class = l_record.m_class
        };

        const auto l_iter = std::find_if(l_sets.begin(), l_sets.end(),
            [&](const auto &p_set) { return p_set.first == l_key; }
        );

        if (l_iter != l_sets.end()) {
            l_iter->second.push_back(l_record);
        } else {
            l_sets.emplace_back(l_key, dns_record_set_t { l_record });
        }
    }

    for (const auto &l_set : l_sets) {
        uint32_t l_ttl = l_set.second.front().m_ttl;

        for (const auto &l_record : l_set.second) {
            l_ttl = std::min(l_ttl, l_record.m_ttl);
        }

        m_cache.insert(
            l_set.first.m_name,
            l_set.first.m_type,
            l_set.first.m_class,
            l_set.second,
            l_ttl
        );
    }
}

void
recursive_resolver::handle_response(
    resolution_context_t &p_context,
    lookup_frame_t       &p_frame,
    const dns_message_t  &p_response
) {
    const dns_response_code l_code = p_response.m_header.m_response_code;

    if (l_code == dns_response_code::NXDOMAIN) {
        const std::optional<dns_resource_record_t> l_soa =
            find_soa(p_response.m_authority);

        cache_rrsets(p_response.m_answers, p_frame.m_zone);

        // the rcode describes the last name of any alias chain in the answer
        if (!follow_answer_cnames(p_context, p_frame, p_response.m_answers)) {
            return;
        }

        if (!p_frame.m_name.is_subdomain_of(p_frame.m_zone)) {
            m_log->trace(
                "alias leaves zone {}, resolving {} afresh",
                p_frame.m_zone.to_string(),
                p_frame.m_name.to_string()
            );

            p_frame.m_state = lookup_state_t::START;

            return;
        }

        if (l_soa) {
            m_cache.insert_negative(
                p_frame.m_name,
                p_frame.m_type,
                p_frame.m_class,
                dns_record_set_t { *l_soa },
                negative_ttl(*l_soa)
            );

            finish(
                p_frame,
                resolution_status_t::NAME_ERROR,
                dns_record_set_t(),
                dns_record_set_t { *l_soa }
            );
        } else {
            finish(p_frame, resolution_status_t::NAME_ERROR);
        }

        return;
    }

    if (l_code != dns_response_code::NOERROR) {
        m_log->warn(
            "server answered {} for {}, trying next",
            dns_response_code_to_string(l_code),
            p_frame.m_name.to_string()
        );

        return;
    }

    cache_rrsets(p_response.m_answers, p_frame.m_zone);

    dns_record_set_t                     l_matching;
    std::optional<dns_resource_record_t> l_cname;

    for (const auto &l_record : p_response.m_answers) {
        if (!(l_record.m_name == p_frame.m_name) ||
            l_record.m_class != p_frame.m_class)
        {
            continue;
        }

        if (l_record.m_type == p_frame.m_type ||
            p_frame.m_type == dns_resource_record_type::ANY)
        {
            l_matching.push_back(l_record);
        } else if (l_record.m_type == dns_resource_record_type::CNAME &&
            std::holds_alternative<cname_data_t>(l_record.m_data) && !l_cname)
        {
            l_cname = l_record;
        }
    }

    if (!l_matching.empty()) {
        finish(p_frame, resolution_status_t::RESOLVED, l_matching);

        return;
    }

    if (l_cname) {
        p_frame.m_cname = l_cname;
        p_frame.m_state = lookup_state_t::FOLLOWING_CNAME;

        return;
    }

    std::optional<delegation_t> l_delegation =
        find_delegation(p_frame, p_response);

    if (l_delegation) {
        p_frame.m_delegation = std::move(l_delegation);
        p_frame.m_state      = lookup_state_t::FOLLOWING_DELEGATION;

        return;
    }

    const std::optional<dns_resource_record_t> l_soa =
        find_soa(p_response.m_authority);

    if (l_soa && p_response.m_answers.empty()) {
        // the name exists but has no data of this type
        m_cache.insert(
            p_frame.m_name,
            p_frame.m_type,
            p_frame.m_class,
            dns_record_set_t(),
            negative_ttl(*l_soa),
            dns_record_set_t { *l_soa }
        );

        finish(
            p_frame,
            resolution_status_t::RESOLVED,
            dns_record_set_t(),
            dns_record_set_t { *l_soa }
        );

        return;
    }

    if (p_response.m_header.m_authoritative && p_response.m_answers.empty()) {
        finish(p_frame, resolution_status_t::RESOLVED);

        return;
    }

    m_log->warn(
        "unusable reply for {} {} in zone {}, trying next server",
        p_frame.m_name.to_string(),
        dns_type_to_string(p_frame.m_type),
        p_frame.m_zone.to_string()
    );
}

std::optional<recursive_resolver::delegation_t>
recursive_resolver::find_delegation(
    const lookup_frame_t &p_frame,
    const dns_message_t  &p_response
) const {
    std::optional<dns_name_t> l_zone;

    for (const auto &l_record : p_response.m_authority) {
        if (l_record.m_type != dns_resource_record_type::NS ||
            !std::holds_alternative<ns_data_t>(l_record.m_data))
        {
            continue;
        }

        // must move strictly closer to the name being chased
        if (p_frame.m_name.is_subdomain_of(l_record.m_name) &&
            l_record.m_name.is_subdomain_of(p_frame.m_zone) &&
            !(l_record.m_name == p_frame.m_zone))
        {
            if (!l_zone || l_record.m_name.label_count() > l_zone->label_count()) {
                l_zone = l_record.m_name;
            }
        }
    }

    if (!l_zone) {
        return std::nullopt;
    }

    delegation_t l_delegation;

    l_delegation.m_zone = *l_zone;

    for (const auto &l_record : p_response.m_authority) {
        if (l_record.m_type == dns_resource_record_type::NS &&
            l_record.m_name == *l_zone &&
            std::holds_alternative<ns_data_t>(l_record.m_data))
        {
            l_delegation.m_nameservers.push_back(l_record);
        }
    }

    for (const auto &l_nameserver : l_delegation.m_nameservers) {
        const dns_name_t &l_host =
            std::get<ns_data_t>(l_nameserver.m_data).m_host;

        bool l_has_glue = false;

        for (const auto &l_record : p_response.m_additional) {
            if (!(l_record.m_name == l_host) ||
                !l_record.m_name.is_subdomain_of(p_frame.m_zone))
            {
                continue;
            }

            if (std::holds_alternative<a_data_t>(l_record.m_data) ||
                std::holds_alternative<aaaa_data_t>(l_record.m_data))
            {
                l_delegation.m_glue.push_back(l_record);
                l_has_glue = true;
            }
        }

        if (!l_has_glue) {
            l_delegation.m_glueless.push_back(l_host);
        }
    }

    for (const auto &l_nameserver : l_delegation.m_nameservers) {
        const std::vector<boost::asio::ip::address> l_found = addresses_of(
            l_delegation.m_glue,
            std::get<ns_data_t>(l_nameserver.m_data).m_host
        );

        for (const auto &l_address : l_found) {
            if (std::find(
                    l_delegation.m_addresses.begin(),
                    l_delegation.m_addresses.end(),
                    l_address
                ) == l_delegation.m_addresses.end())
            {
                l_delegation.m_addresses.push_back(l_address);
            }
        }
    }

    // prefer IPv4 glue, order is otherwise as received
    std::stable_partition(
        l_delegation.m_addresses.begin(),
        l_delegation.m_addresses.end(),
        [](const auto &p_address) { return p_address.is_v4(); }
    );

    return l_delegation;
}

void
recursive_resolver::follow_cname(
    resolution_context_t &p_context,
    lookup_frame_t       &p_frame
) {
    const dns_resource_record_t l_cname = *p_frame.m_cname;
    const dns_name_t &l_target = std::get<cname_data_t>(l_cname.m_data).m_target;

    p_frame.m_cname.reset();

    if (p_frame.m_visited.count(l_target)) {
        m_log->warn(
            "cname loop at {} -> {}",
            l_cname.m_name.to_string(),
            l_target.to_string()
        );

        finish(p_frame, resolution_status_t::LOOP_DETECTED);

        return;
    }

    if (p_context.m_depth == 0) {
        finish(p_frame, resolution_status_t::TOO_MANY_REDIRECTIONS);

        return;
    }

    p_context.m_depth--;

    m_log->trace(
        "following cname {} -> {}",
        l_cname.m_name.to_string(),
        l_target.to_string()
    );

    p_frame.m_visited.insert(l_target);
    p_frame.m_chain.push_back(l_cname);
    p_frame.m_name  = l_target;
    p_frame.m_state = lookup_state_t::START;
}

bool
recursive_resolver::follow_answer_cnames(
    resolution_context_t   &p_context,
    lookup_frame_t         &p_frame,
    const dns_record_set_t &p_answers
) {
    while (true) {
        const auto l_iter = std::find_if(
            p_answers.begin(),
            p_answers.end(),
            [&](const dns_resource_record_t &p_record) {
                return p_record.m_name == p_frame.m_name
                    && p_record.m_class == p_frame.m_class
                    && std::holds_alternative<cname_data_t>(p_record.m_data);
            }
        );

        if (l_iter == p_answers.end()) {
            return true;
        }

        p_frame.m_cname = *l_iter;

        follow_cname(p_context, p_frame);

        if (p_frame.m_state == lookup_state_t::FAILED) {
            return false;
        }
    }
}

void
recursive_resolver::follow_delegation(
    resolution_context_t &p_context,
    lookup_frame_t       &p_frame
) {
    const delegation_t l_delegation = std::move(*p_frame.m_delegation);

    p_frame.m_delegation.reset();

    if (p_context.m_depth == 0) {
        finish(p_frame, resolution_status_t::TOO_MANY_REDIRECTIONS);

        return;
    }

    p_context.m_depth--;

    cache_rrsets(l_delegation.m_nameservers, p_frame.m_zone);
    cache_rrsets(l_delegation.m_glue, p_frame.m_zone);

    m_log->trace(
        "delegated from {} to {} with {} addresses, {} without glue",
        p_frame.m_zone.to_string(),
        l_delegation.m_zone.to_string(),
        l_delegation.m_addresses.size(),
        l_delegation.m_glueless.size()
    );

    p_frame.m_zone          = l_delegation.m_zone;
    p_frame.m_servers       = l_delegation.m_addresses;
    p_frame.m_next_server   = 0;
    p_frame.m_glueless      = l_delegation.m_glueless;
    p_frame.m_next_glueless = 0;
    p_frame.m_state         = lookup_state_t::QUERYING_SERVER;
}

void
recursive_resolver::finish(
    lookup_frame_t           &p_frame,
    const resolution_status_t p_status,
    const dns_record_set_t   &p_records,
    const dns_record_set_t   &p_authority
) {
    p_frame.m_result.m_status    = p_status;
    p_frame.m_result.m_answers   = p_frame.m_chain;
    p_frame.m_result.m_authority = p_authority;

    p_frame.m_result.m_answers.insert(
        p_frame.m_result.m_answers.end(),
        p_records.begin(),
        p_records.end()
    );

    p_frame.m_state = (p_status == resolution_status_t::RESOLVED)
        ? lookup_state_t::RESOLVED
        : lookup_state_t::FAILED;
}
