#include "sdl_dispatcher.hpp"
#include <cstdio>
#include <stdexcept>
#include <string>

SdlDispatcher::SdlDispatcher() : m_event_type(SDL_RegisterEvents(1)) {
    if (m_event_type == (Uint32)-1) {
        throw std::runtime_error("SDL_RegisterEvents failed: " +
                                 std::string(SDL_GetError()));
    }
}

SdlDispatcher::~SdlDispatcher() {
    // Wake-ups carry no payload; just keep them from outliving us
    SDL_FlushEvent(m_event_type);
}

void SdlDispatcher::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(task));
    if (!m_wakeup_queued) {
        push_wakeup();
    }
}

// Called with m_mutex held.
void SdlDispatcher::push_wakeup() {
    SDL_Event ev;
    SDL_zero(ev);
    ev.type = m_event_type;

    if (SDL_PushEvent(&ev) == 1) {
        m_wakeup_queued = true;
    } else {
        // The task stays queued; the next post or idle pass picks it up
        fprintf(stderr, "%s: Failed to push wake-up event: %s\n", __func__,
                SDL_GetError());
    }
}

bool SdlDispatcher::dispatch(const SDL_Event &ev) {
    if (ev.type != m_event_type) {
        return false;
    }
    run_pending();
    return true;
}

void SdlDispatcher::run_pending() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_tasks);
        m_wakeup_queued = false;
    }

    // Tasks posted while this batch runs get a wake-up of their own
    for (auto &task : batch) {
        task();
    }
}
