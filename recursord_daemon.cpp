#include "recursord_daemon.hpp"

recursord_daemon::recursord_daemon(
    std::shared_ptr<spdlog::logger> p_log,
    const recursord_config_t       &p_config,
    std::vector<root_hint_t>        p_root_hints
):
    m_log(p_log),
    m_config(p_config),
    m_dns_cache(p_log, p_config.m_cache),
    m_transport(p_log, p_config.m_upstream_port, p_config.m_request_timeout),
    m_resolver(
        p_log,
        m_dns_cache,
        m_transport,
        p_config.m_resolver,
        std::move(p_root_hints)
    ),
    m_request_handler(p_log, m_resolver)
{
    m_log->trace("recursord_daemon constructor");

    m_log->info(
        "cache {} entries in {} shards, ttl {}..{}s, max depth {}",
        m_config.m_cache.m_max_entries,
        m_config.m_cache.m_shards,
        m_config.m_cache.m_ttl_floor,
        m_config.m_cache.m_ttl_ceiling,
        m_config.m_resolver.m_max_depth
    );

    m_server = std::make_unique<dns_server>(
        p_log,
        m_request_handler,
        m_config.m_listen_address,
        m_config.m_port,
        m_config.m_workers
    );
}

recursord_daemon::~recursord_daemon()
{
    m_log->trace("recursord_daemon destructor");

    m_server.reset();
}

void
recursord_daemon::await_shutdown()
{
    m_stopper.await_stop_block();
}

void
recursord_daemon::shutdown()
{
    m_stopper.stop();
}
