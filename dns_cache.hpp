#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "dns_codec.hpp"
#include "lru_map.hpp"
#include "stopper.hpp"

struct cache_key_t {
    dns_name_t               m_name;
    dns_resource_record_type m_type;
    dns_class                m_class;

    bool
    operator == (const cache_key_t &p_other) const {
        return ( m_name  == p_other.m_name  )
            && ( m_type  == p_other.m_type  )
            && ( m_class == p_other.m_class );
    };

    struct hasher {
        std::size_t operator() (const cache_key_t &p_key) const;
    };
};

struct cache_hit_t {
    // negative entries stand for NXDOMAIN and carry no records
    bool             m_negative;
    dns_record_set_t m_records;
    // SOA kept alongside a negative or empty answer
    dns_record_set_t m_authority;
};

struct dns_cache_config_t {
    size_t                    m_max_entries          = 65536;
    size_t                    m_shards               = 16;
    uint32_t                  m_ttl_floor            = 5;
    uint32_t                  m_ttl_ceiling          = 86400;
    uint32_t                  m_negative_ttl_ceiling = 10800;
    // zero disables the background sweep
    std::chrono::milliseconds m_sweep_interval       = std::chrono::seconds(30);
};

class dns_cache : private boost::noncopyable {
public:
    typedef std::chrono::steady_clock::time_point time_point_t;
    typedef std::function<time_point_t ()>        clock_fn_t;

    dns_cache(
        std::shared_ptr<spdlog::logger> p_log,
        const dns_cache_config_t       &p_config,
        clock_fn_t                      p_clock=&std::chrono::steady_clock::now
    );

    ~dns_cache();

    std::optional<cache_hit_t>
    lookup(
        const dns_name_t               &p_name,
        const dns_resource_record_type  p_type,
        const dns_class                 p_class
    );

    void
    insert(
        const dns_name_t               &p_name,
        const dns_resource_record_type  p_type,
        const dns_class                 p_class,
        const dns_record_set_t         &p_records,
        const uint32_t                  p_ttl,
        const dns_record_set_t         &p_authority=dns_record_set_t()
    );

    void
    insert_negative(
        const dns_name_t               &p_name,
        const dns_resource_record_type  p_type,
        const dns_class                 p_class,
        const dns_record_set_t         &p_authority,
        const uint32_t                  p_negative_ttl
    );

    // drops every expired entry, returns how many were removed
    size_t sweep();

    size_t size();

private:
    struct entry_t {
        dns_record_set_t m_records;
        dns_record_set_t m_authority;
        time_point_t     m_inserted;
        uint32_t         m_ttl;
        bool             m_negative;
    };

    struct shard_t {
        shard_t(const size_t p_max_size): m_entries(p_max_size) {}

        std::shared_mutex                                m_lock;
        lru_map<cache_key_t, entry_t, cache_key_t::hasher> m_entries;
    };

    shard_t &shard_for(const cache_key_t &p_key);

    void store(const cache_key_t &p_key, const entry_t &p_entry);

    static bool
    is_expired(const entry_t &p_entry, const time_point_t p_now) noexcept;

    void reaper_thread();

    const std::shared_ptr<spdlog::logger>  m_log;
    const dns_cache_config_t               m_config;
    const clock_fn_t                       m_clock;
    std::vector<std::unique_ptr<shard_t>>  m_shards;
    stopper                                m_stopper;
    std::thread                            m_thread;
};
