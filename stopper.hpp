#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// One shot stop signal shared between a owner and its worker threads.
class stopper {
public:
    stopper();

    ~stopper();

    void stop();

    void await_stop_block();

    bool should_stop();

    // returns true once stopped, false when the timeout elapsed first
    bool await_stop_for(const std::chrono::milliseconds p_timeout);

private:
    std::mutex              m_lock;
    std::condition_variable m_condition;
    bool                    m_stop_state;
};
