#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "dns_cache.hpp"

static std::shared_ptr<spdlog::logger> g_log =
    spdlog::null_logger_mt("dns_cache_test");

class fake_clock {
public:
    fake_clock(): m_now(dns_cache::time_point_t()) {}

    dns_cache::clock_fn_t
    function()
    {
        return [this]() { return m_now.load(); };
    }

    void
    advance(const std::chrono::seconds p_by)
    {
        m_now.store(m_now.load() + p_by);
    }

private:
    // read by the sweep thread
    std::atomic<dns_cache::time_point_t> m_now;
};

static dns_cache_config_t
manual_config()
{
    dns_cache_config_t l_config;

    l_config.m_sweep_interval = std::chrono::milliseconds(0);

    return l_config;
}

static const dns_name_t g_name = dns_name_t::from_string("www.example.com");

static dns_record_set_t
a_records(const uint32_t p_ttl)
{
    return {
        dns_resource_record_t {
            .m_name  = g_name,
            .m_type  = dns_resource_record_type::A,
            .m_class = dns_class::INTERNET,
            .m_ttl   = p_ttl,
            .m_data  = a_data_t {
                .m_address = boost::asio::ip::make_address_v4("192.0.2.10")
            }
        }
    };
}

static dns_record_set_t
soa_records(const uint32_t p_ttl, const uint32_t p_minimum)
{
    return {
        dns_resource_record_t {
            .m_name  = dns_name_t::from_string("example.com"),
            .m_type  = dns_resource_record_type::SOA,
            .m_class = dns_class::INTERNET,
            .m_ttl   = p_ttl,
            .m_data  = soa_data_t {
                .m_primary = dns_name_t::from_string("ns1.example.com"),
                .m_mailbox = dns_name_t::from_string("admin.example.com"),
                .m_minimum = p_minimum
            }
        }
    };
}

static void
test_miss_on_empty()
{
    dns_cache l_cache(g_log, manual_config());

    assert(!l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());
}

static void
test_hit_until_expiry_then_lazily_removed()
{
    fake_clock l_clock;
    dns_cache  l_cache(g_log, manual_config(), l_clock.function());

    l_cache.insert(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(60),
        60
    );

    l_clock.advance(std::chrono::seconds(59));

    const std::optional<cache_hit_t> l_hit = l_cache.lookup(
        dns_name_t::from_string("WWW.EXAMPLE.COM"),
        dns_resource_record_type::A,
        dns_class::INTERNET
    );

    assert(l_hit.has_value());
    assert(!l_hit->m_negative);
    assert(l_hit->m_records.size() == 1);
    // remaining lifetime is reported, not the original TTL
    assert(l_hit->m_records[0].m_ttl == 1);

    l_clock.advance(std::chrono::seconds(1));

    assert(l_cache.size() == 1);

    assert(!l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());

    assert(l_cache.size() == 0);
}

static void
test_type_and_class_are_part_of_key()
{
    dns_cache l_cache(g_log, manual_config());

    l_cache.insert(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(60),
        60
    );

    assert(!l_cache.lookup(
        g_name,
        dns_resource_record_type::AAAA,
        dns_class::INTERNET
    ).has_value());

    assert(!l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::CHAOS
    ).has_value());
}

static void
test_ttl_floor_and_ceiling()
{
    fake_clock         l_clock;
    dns_cache_config_t l_config = manual_config();

    l_config.m_ttl_floor   = 30;
    l_config.m_ttl_ceiling = 100;

    dns_cache l_cache(g_log, l_config, l_clock.function());

    const dns_name_t l_short = dns_name_t::from_string("short.example.com");
    const dns_name_t l_long  = dns_name_t::from_string("long.example.com");

    l_cache.insert(
        l_short,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(0),
        0
    );

    l_cache.insert(
        l_long,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(1000000),
        1000000
    );

    l_clock.advance(std::chrono::seconds(29));

    assert(l_cache.lookup(
        l_short,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());

    l_clock.advance(std::chrono::seconds(1));

    assert(!l_cache.lookup(
        l_short,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());

    const std::optional<cache_hit_t> l_hit = l_cache.lookup(
        l_long,
        dns_resource_record_type::A,
        dns_class::INTERNET
    );

    assert(l_hit.has_value());
    assert(l_hit->m_records[0].m_ttl == 70);

    l_clock.advance(std::chrono::seconds(70));

    assert(!l_cache.lookup(
        l_long,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());
}

static void
test_negative_entry()
{
    fake_clock         l_clock;
    dns_cache_config_t l_config = manual_config();

    l_config.m_negative_ttl_ceiling = 600;

    dns_cache l_cache(g_log, l_config, l_clock.function());

    l_cache.insert_negative(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        soa_records(3600, 3600),
        3600
    );

    const std::optional<cache_hit_t> l_hit = l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET
    );

    assert(l_hit.has_value());
    assert(l_hit->m_negative);
    assert(l_hit->m_records.empty());
    assert(l_hit->m_authority.size() == 1);
    assert(l_hit->m_authority[0].m_ttl == 600);

    l_clock.advance(std::chrono::seconds(600));

    assert(!l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());
}

static void
test_positive_replaces_negative()
{
    dns_cache l_cache(g_log, manual_config());

    l_cache.insert_negative(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        soa_records(300, 300),
        300
    );

    l_cache.insert(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(60),
        60
    );

    const std::optional<cache_hit_t> l_hit = l_cache.lookup(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET
    );

    assert(l_hit.has_value());
    assert(!l_hit->m_negative);
    assert(l_cache.size() == 1);
}

static void
test_sweep_removes_only_expired()
{
    fake_clock l_clock;
    dns_cache  l_cache(g_log, manual_config(), l_clock.function());

    for (int l_i = 0; l_i < 10; l_i++) {
        l_cache.insert(
            dns_name_t::from_string("host" + std::to_string(l_i) + ".test"),
            dns_resource_record_type::A,
            dns_class::INTERNET,
            a_records(60),
            l_i < 4 ? 10 : 1000
        );
    }

    assert(l_cache.size() == 10);
    assert(l_cache.sweep() == 0);

    l_clock.advance(std::chrono::seconds(10));

    assert(l_cache.sweep() == 4);
    assert(l_cache.size() == 6);
}

static void
test_capacity_bound()
{
    dns_cache_config_t l_config = manual_config();

    l_config.m_max_entries = 8;
    l_config.m_shards      = 1;

    dns_cache l_cache(g_log, l_config);

    for (int l_i = 0; l_i < 20; l_i++) {
        l_cache.insert(
            dns_name_t::from_string("host" + std::to_string(l_i) + ".test"),
            dns_resource_record_type::A,
            dns_class::INTERNET,
            a_records(60),
            60
        );
    }

    assert(l_cache.size() == 8);

    assert(l_cache.lookup(
        dns_name_t::from_string("host19.test"),
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());

    assert(!l_cache.lookup(
        dns_name_t::from_string("host0.test"),
        dns_resource_record_type::A,
        dns_class::INTERNET
    ).has_value());
}

static void
test_concurrent_access()
{
    dns_cache l_cache(g_log, manual_config());

    std::vector<std::thread> l_threads;
    std::atomic<size_t>      l_hits(0);

    for (int l_t = 0; l_t < 8; l_t++) {
        l_threads.emplace_back([&, l_t]() {
            for (int l_i = 0; l_i < 500; l_i++) {
                const dns_name_t l_name = dns_name_t::from_string(
                    "host" + std::to_string(l_i % 50) + ".test"
                );

                if (l_t % 2 == 0) {
                    l_cache.insert(
                        l_name,
                        dns_resource_record_type::A,
                        dns_class::INTERNET,
                        a_records(60),
                        60
                    );
                } else if (l_cache.lookup(
                    l_name,
                    dns_resource_record_type::A,
                    dns_class::INTERNET
                )) {
                    l_hits++;
                }
            }
        });
    }

    for (auto &l_thread : l_threads) {
        l_thread.join();
    }

    assert(l_cache.size() == 50);
    assert(l_hits.load() <= 4 * 500);
}

static void
test_background_sweep()
{
    fake_clock         l_clock;
    dns_cache_config_t l_config;

    l_config.m_sweep_interval = std::chrono::milliseconds(10);

    dns_cache l_cache(g_log, l_config, l_clock.function());

    l_cache.insert(
        g_name,
        dns_resource_record_type::A,
        dns_class::INTERNET,
        a_records(60),
        60
    );

    l_clock.advance(std::chrono::seconds(120));

    for (int l_i = 0; l_i < 500 && l_cache.size() != 0; l_i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    assert(l_cache.size() == 0);
}

int
main()
{
    test_miss_on_empty();
    test_hit_until_expiry_then_lazily_removed();
    test_type_and_class_are_part_of_key();
    test_ttl_floor_and_ceiling();
    test_negative_entry();
    test_positive_replaces_negative();
    test_sweep_removes_only_expired();
    test_capacity_bound();
    test_concurrent_access();
    test_background_sweep();

    return 0;
}
