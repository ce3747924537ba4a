#pragma once

#include "ui_dispatcher.hpp"
#include <SDL.h>
#include <deque>
#include <functional>
#include <mutex>

// Delivers posted tasks on the thread that pumps SDL events.
// Tasks wait in an internal queue; SDL only carries a wake-up event, so a
// full or filtered SDL queue delays tasks but never drops them.
// Requires SDL_INIT_EVENTS for as long as the dispatcher is in use.
class SdlDispatcher : public UiDispatcher {
public:
    SdlDispatcher();
    ~SdlDispatcher() override;

    SdlDispatcher(const SdlDispatcher &) = delete;
    SdlDispatcher &operator=(const SdlDispatcher &) = delete;

    // Thread-safe. Queues the task and wakes the event loop if needed.
    void post(std::function<void()> task) override;

    // Runs queued tasks if ev is our wake-up. Returns false otherwise.
    bool dispatch(const SDL_Event &ev);

    // Runs everything queued so far. The loop also calls this when idle,
    // which covers a wake-up that SDL refused.
    void run_pending();

    Uint32 event_type() const { return m_event_type; }

private:
    void push_wakeup();

    Uint32 m_event_type;

    std::mutex m_mutex;
    std::deque<std::function<void()>> m_tasks;
    bool m_wakeup_queued = false;
};
