#include "stopper.hpp"

stopper::stopper(): m_stop_state(false) {}

stopper::~stopper()
{
    stop();
}

void
stopper::stop()
{
    {
        std::lock_guard<std::mutex> l_guard(m_lock);

        m_stop_state = true;
    }

    m_condition.notify_all();
}

void
stopper::await_stop_block()
{
    std::unique_lock<std::mutex> l_guard(m_lock);

    m_condition.wait(l_guard, [this]() { return m_stop_state; });
}

bool
stopper::should_stop()
{
    std::lock_guard<std::mutex> l_guard(m_lock);

    return m_stop_state;
}

bool
stopper::await_stop_for(const std::chrono::milliseconds p_timeout)
{
    std::unique_lock<std::mutex> l_guard(m_lock);

    return m_condition.wait_for(
        l_guard,
        p_timeout,
        [this]() { return m_stop_state; }
    );
}
