#include <stdexcept>

#include "config.hpp"
#include "misc.hpp"

static uint16_t
port_from_json(const nlohmann::json &p_value, const std::string &p_key)
{
    const int64_t l_port = p_value.get<int64_t>();

    if (l_port < 0 || l_port > 65535) {
        throw std::runtime_error(p_key + " out of range");
    }

    return static_cast<uint16_t>(l_port);
}

static uint64_t
positive_from_json(const nlohmann::json &p_value, const std::string &p_key)
{
    const int64_t l_value = p_value.get<int64_t>();

    if (l_value <= 0) {
        throw std::runtime_error(p_key + " must be positive");
    }

    return static_cast<uint64_t>(l_value);
}

static uint64_t
unsigned_from_json(const nlohmann::json &p_value, const std::string &p_key)
{
    const int64_t l_value = p_value.get<int64_t>();

    if (l_value < 0) {
        throw std::runtime_error(p_key + " must not be negative");
    }

    return static_cast<uint64_t>(l_value);
}

void
apply_config_json(recursord_config_t &p_config, const nlohmann::json &p_json)
{
    if (!p_json.is_object()) {
        throw std::runtime_error("configuration must be a json object");
    }

    for (const auto &[l_key, l_value] : p_json.items()) {
        if (l_key == "listen_address") {
            p_config.m_listen_address =
                address_from_string(l_value.get<std::string>(), "listen");
        } else if (l_key == "port") {
            p_config.m_port = port_from_json(l_value, l_key);
        } else if (l_key == "upstream_port") {
            p_config.m_upstream_port = port_from_json(l_value, l_key);

            if (p_config.m_upstream_port == 0) {
                throw std::runtime_error("upstream_port must be positive");
            }
        } else if (l_key == "request_timeout_ms") {
            p_config.m_request_timeout =
                std::chrono::milliseconds(positive_from_json(l_value, l_key));
        } else if (l_key == "resolution_timeout_ms") {
            p_config.m_resolver.m_resolution_timeout =
                std::chrono::milliseconds(positive_from_json(l_value, l_key));
        } else if (l_key == "max_depth") {
            p_config.m_resolver.m_max_depth =
                static_cast<unsigned int>(unsigned_from_json(l_value, l_key));
        } else if (l_key == "cache_max_entries") {
            p_config.m_cache.m_max_entries = positive_from_json(l_value, l_key);
        } else if (l_key == "cache_shards") {
            p_config.m_cache.m_shards = positive_from_json(l_value, l_key);
        } else if (l_key == "ttl_floor") {
            p_config.m_cache.m_ttl_floor =
                static_cast<uint32_t>(unsigned_from_json(l_value, l_key));
        } else if (l_key == "ttl_ceiling") {
            p_config.m_cache.m_ttl_ceiling =
                static_cast<uint32_t>(positive_from_json(l_value, l_key));
        } else if (l_key == "negative_ttl_ceiling") {
            p_config.m_cache.m_negative_ttl_ceiling =
                static_cast<uint32_t>(positive_from_json(l_value, l_key));
        } else if (l_key == "sweep_interval_ms") {
            p_config.m_cache.m_sweep_interval =
                std::chrono::milliseconds(unsigned_from_json(l_value, l_key));
        } else if (l_key == "workers") {
            p_config.m_workers = positive_from_json(l_value, l_key);
        } else if (l_key == "root_hints") {
            p_config.m_root_hints_path = l_value.get<std::string>();
        } else if (l_key == "log_level") {
            p_config.m_log_level = l_value.get<std::string>();
        } else {
            throw std::runtime_error("unknown configuration key " + l_key);
        }
    }

    if (p_config.m_cache.m_ttl_floor > p_config.m_cache.m_ttl_ceiling) {
        throw std::runtime_error("ttl_floor is above ttl_ceiling");
    }
}

recursord_config_t
load_config(const std::string &p_path)
{
    recursord_config_t l_config;

    apply_config_json(l_config, nlohmann::json::parse(file_to_string(p_path)));

    return l_config;
}

std::vector<root_hint_t>
default_root_hints()
{
    static const std::vector<std::pair<std::string, std::string>> l_table = {
        { "a.root-servers.net.", "198.41.0.4"     },
        { "b.root-servers.net.", "170.247.170.2"  },
        { "c.root-servers.net.", "192.33.4.12"    },
        { "d.root-servers.net.", "199.7.91.13"    },
        { "e.root-servers.net.", "192.203.230.10" },
        { "f.root-servers.net.", "192.5.5.241"    },
        { "g.root-servers.net.", "192.112.36.4"   },
        { "h.root-servers.net.", "198.97.190.53"  },
        { "i.root-servers.net.", "192.36.148.17"  },
        { "j.root-servers.net.", "192.58.128.30"  },
        { "k.root-servers.net.", "193.0.14.129"   },
        { "l.root-servers.net.", "199.7.83.42"    },
        { "m.root-servers.net.", "202.12.27.33"   }
    };

    std::vector<root_hint_t> l_hints;

    for (const auto &[l_name, l_address] : l_table) {
        l_hints.push_back(root_hint_t {
            .m_name    = dns_name_t::from_string(l_name),
            .m_address = boost::asio::ip::make_address(l_address)
        });
    }

    return l_hints;
}

std::vector<root_hint_t>
parse_root_hints(const nlohmann::json &p_json)
{
    if (!p_json.is_array()) {
        throw std::runtime_error("root hints must be a json array");
    }

    std::vector<root_hint_t> l_hints;

    for (const auto &l_entry : p_json) {
        l_hints.push_back(root_hint_t {
            .m_name    = dns_name_t::from_string(
                l_entry.at("name").get<std::string>()
            ),
            .m_address = address_from_string(
                l_entry.at("address").get<std::string>(),
                "root hint"
            )
        });
    }

    if (l_hints.empty()) {
        throw std::runtime_error("root hints are empty");
    }

    return l_hints;
}

std::vector<root_hint_t>
load_root_hints(const std::optional<std::string> &p_path)
{
    if (!p_path) {
        return default_root_hints();
    }

    return parse_root_hints(nlohmann::json::parse(file_to_string(*p_path)));
}
