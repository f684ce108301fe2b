#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "dns_cache.hpp"
#include "dns_server.hpp"
#include "request_handler.hpp"
#include "resolver.hpp"
#include "stopper.hpp"
#include "upstream_transport.hpp"

class recursord_daemon {
public:
    recursord_daemon(
        std::shared_ptr<spdlog::logger> p_log,
        const recursord_config_t       &p_config,
        std::vector<root_hint_t>        p_root_hints
    );

    ~recursord_daemon();

    void await_shutdown();

    void shutdown();

private:
    std::shared_ptr<spdlog::logger> m_log;
    const recursord_config_t        m_config;
    dns_cache                       m_dns_cache;
    asio_upstream_transport         m_transport;
    recursive_resolver              m_resolver;
    request_handler                 m_request_handler;
    stopper                         m_stopper;
    std::unique_ptr<dns_server>     m_server;
};
