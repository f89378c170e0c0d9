#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <utility>
#include <vector>

namespace sched {

// ---------------------------------------------------------------------------
// Events<T>: typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears every registered queue; install it as the
// first pre-update step so events live for exactly one frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// Sends into Events<T> if the queue was registered. Returns false otherwise.
template<typename T>
bool send_event(ecs::World& world, T event) {
    auto* q = world.try_resource<Events<T>>();
    if (!q) return false;
    q->send(std::move(event));
    return true;
}

// ---------------------------------------------------------------------------
// EventRegistry: flush coordinator (stored as a World resource)
//
// register_queue<T>(world) creates the queue resource; calling it twice for
// the same T is harmless (the queue is kept, the flush is not duplicated).
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (world.try_resource<Events<T>>()) return;
        world.set_resource(Events<T>{});
        flush_fns_.push_back([](ecs::World& w) {
            if (auto* q = w.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all(ecs::World& world) {
        for (auto& fn : flush_fns_) fn(world);
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void(ecs::World&)>> flush_fns_;
};

} // namespace sched
