#include <algorithm>
#include <mutex>

#include <boost/functional/hash.hpp>

#include "dns_cache.hpp"

std::size_t
cache_key_t::hasher::operator() (const cache_key_t &p_key) const
{
    std::size_t l_seed = dns_name_t::hasher()(p_key.m_name);

    boost::hash_combine(
        l_seed,
        boost::hash_value(static_cast<uint16_t>(p_key.m_type))
    );

    boost::hash_combine(
        l_seed,
        boost::hash_value(static_cast<uint16_t>(p_key.m_class))
    );

    return l_seed;
}

dns_cache::dns_cache(
    std::shared_ptr<spdlog::logger> p_log,
    const dns_cache_config_t       &p_config,
    clock_fn_t                      p_clock
):
    m_log(p_log),
    m_config(p_config),
    m_clock(p_clock)
{
    const size_t l_shard_count = std::max<size_t>(m_config.m_shards, 1);
    const size_t l_shard_size  =
        std::max<size_t>(m_config.m_max_entries / l_shard_count, 1);

    for (size_t l_i = 0; l_i < l_shard_count; l_i++) {
        m_shards.push_back(std::make_unique<shard_t>(l_shard_size));
    }

    if (m_config.m_sweep_interval.count() > 0) {
        m_thread = std::thread(&dns_cache::reaper_thread, this);
    }
}

dns_cache::~dns_cache()
{
    m_stopper.stop();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

dns_cache::shard_t &
dns_cache::shard_for(const cache_key_t &p_key)
{
    return *m_shards[cache_key_t::hasher()(p_key) % m_shards.size()];
}

bool
dns_cache::is_expired(const entry_t &p_entry, const time_point_t p_now) noexcept
{
    return p_now >= p_entry.m_inserted + std::chrono::seconds(p_entry.m_ttl);
}

std::optional<cache_hit_t>
dns_cache::lookup(
    const dns_name_t               &p_name,
    const dns_resource_record_type  p_type,
    const dns_class                 p_class
) {
    const cache_key_t l_key = {
        .m_name  = p_name,
        .m_type  = p_type,
        .m_class = p_class
    };

    shard_t &l_shard = shard_for(l_key);

    const time_point_t l_now = m_clock();

    std::optional<entry_t> l_entry;

    {
        std::shared_lock l_guard(l_shard.m_lock);

        l_entry = l_shard.m_entries.lookup(l_key);
    }

    if (!l_entry) {
        return std::nullopt;
    }

    if (is_expired(*l_entry, l_now)) {
        std::unique_lock l_guard(l_shard.m_lock);

        // a writer may have replaced the entry since the shared lock
        const std::optional<entry_t> l_current = l_shard.m_entries.lookup(l_key);

        if (l_current && is_expired(*l_current, l_now)) {
            l_shard.m_entries.erase(l_key);

            m_log->trace(
                "cache expired {} {}",
                p_name.to_string(),
                dns_type_to_string(p_type)
            );
        }

        return std::nullopt;
    }

    const uint32_t l_age = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            l_now - l_entry->m_inserted
        ).count()
    );

    const uint32_t l_remaining = l_entry->m_ttl - l_age;

    cache_hit_t l_hit = {
        .m_negative  = l_entry->m_negative,
        .m_records   = std::move(l_entry->m_records),
        .m_authority = std::move(l_entry->m_authority)
    };

    for (auto &l_record : l_hit.m_records) {
        l_record.m_ttl = std::min(l_record.m_ttl, l_remaining);
    }

    for (auto &l_record : l_hit.m_authority) {
        l_record.m_ttl = std::min(l_record.m_ttl, l_remaining);
    }

    return l_hit;
}

void
dns_cache::store(const cache_key_t &p_key, const entry_t &p_entry)
{
    shard_t &l_shard = shard_for(p_key);

    std::unique_lock l_guard(l_shard.m_lock);

    if (l_shard.m_entries.insert(p_key, p_entry)) {
        m_log->debug("cache shard full, evicted oldest entry");
    }
}

void
dns_cache::insert(
    const dns_name_t               &p_name,
    const dns_resource_record_type  p_type,
    const dns_class                 p_class,
    const dns_record_set_t         &p_records,
    const uint32_t                  p_ttl,
    const dns_record_set_t         &p_authority
) {
    const uint32_t l_ttl = std::clamp(
        p_ttl,
        m_config.m_ttl_floor,
        std::max(m_config.m_ttl_floor, m_config.m_ttl_ceiling)
    );

    m_log->trace(
        "cache insert {} {} {} records ttl {}",
        p_name.to_string(),
        dns_type_to_string(p_type),
        p_records.size(),
        l_ttl
    );

    store(
        cache_key_t {
            .m_name  = p_name,
            .m_type  = p_type,
            .m_class = p_class
        },
        entry_t {
            .m_records   = p_records,
            .m_authority = p_authority,
            .m_inserted  = m_clock(),
            .m_ttl       = l_ttl,
            .m_negative  = false
        }
    );
}

void
dns_cache::insert_negative(
    const dns_name_t               &p_name,
    const dns_resource_record_type  p_type,
    const dns_class                 p_class,
    const dns_record_set_t         &p_authority,
    const uint32_t                  p_negative_ttl
) {
    const uint32_t l_ttl = std::clamp(
        p_negative_ttl,
        m_config.m_ttl_floor,
        std::max(m_config.m_ttl_floor, m_config.m_negative_ttl_ceiling)
    );

    m_log->trace(
        "cache insert negative {} {} ttl {}",
        p_name.to_string(),
        dns_type_to_string(p_type),
        l_ttl
    );

    store(
        cache_key_t {
            .m_name  = p_name,
            .m_type  = p_type,
            .m_class = p_class
        },
        entry_t {
            .m_records   = dns_record_set_t(),
            .m_authority = p_authority,
            .m_inserted  = m_clock(),
            .m_ttl       = l_ttl,
            .m_negative  = true
        }
    );
}

size_t
dns_cache::sweep()
{
    const time_point_t l_now     = m_clock();
    size_t             l_removed = 0;

    for (auto &l_shard : m_shards) {
        std::unique_lock l_guard(l_shard->m_lock);

        l_removed += l_shard->m_entries.erase_if(
            [&](const cache_key_t &, const entry_t &p_entry) {
                return is_expired(p_entry, l_now);
            }
        );
    }

    return l_removed;
}

size_t
dns_cache::size()
{
    size_t l_total = 0;

    for (auto &l_shard : m_shards) {
        std::shared_lock l_guard(l_shard->m_lock);

        l_total += l_shard->m_entries.size();
    }

    return l_total;
}

void
dns_cache::reaper_thread()
{
    m_log->trace("dns_cache::reaper_thread() entry");

    while (!m_stopper.await_stop_for(m_config.m_sweep_interval)) {
        const size_t l_removed = sweep();

        if (l_removed) {
            m_log->debug("cache sweep removed {} entries", l_removed);
        }
    }

    m_log->trace("dns_cache::reaper_thread() exit");
}
