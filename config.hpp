#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>
#include <nlohmann/json.hpp>

#include "dns_cache.hpp"
#include "resolver.hpp"

struct recursord_config_t {
    boost::asio::ip::address   m_listen_address =
        boost::asio::ip::address_v4::any();
    uint16_t                   m_port            = 53;
    uint16_t                   m_upstream_port   = 53;
    std::chrono::milliseconds  m_request_timeout = std::chrono::seconds(2);
    size_t                     m_workers         = 64;
    std::optional<std::string> m_root_hints_path;
    std::string                m_log_level       = "info";
    resolver_config_t          m_resolver;
    dns_cache_config_t         m_cache;
};

// Overlays the keys present in p_json onto p_config. Unknown keys and
// out of range values throw std::runtime_error.
void
apply_config_json(recursord_config_t &p_config, const nlohmann::json &p_json);

recursord_config_t
load_config(const std::string &p_path);

// the IANA root server table, IPv4 addresses only
std::vector<root_hint_t>
default_root_hints();

// array of { "name": "a.root-servers.net.", "address": "198.41.0.4" }
std::vector<root_hint_t>
parse_root_hints(const nlohmann::json &p_json);

std::vector<root_hint_t>
load_root_hints(const std::optional<std::string> &p_path);
