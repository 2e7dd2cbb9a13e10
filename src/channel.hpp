#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "common.hpp"

/// \brief Bounded multi-producer queue. Producers block while the queue is
/// full, so results are consumed as they are produced instead of piling
/// up in memory.
template <typename T>
class Channel {
  public:
    explicit Channel(std::size_t _capacity)
        : capacity(std::max<std::size_t>(_capacity, 1)) {}

    /// Wait for the free space and enqueue \arg value. Returns false if the
    /// channel was closed, the value is dropped in that case.
    bool push(T value) {
        std::unique_lock lock{mutex};
        not_full.wait(
            lock, [this]() { return closed || items.size() < capacity; });
        if (closed) { return false; }
        items.push_back(std::move(value));
        not_empty.notify_one();
        return true;
    }

    /// Wait for the next value. Empty result means the channel is closed
    /// and fully drained.
    Opt<T> pop() {
        std::unique_lock lock{mutex};
        not_empty.wait(lock, [this]() { return closed || !items.empty(); });
        if (items.empty()) { return std::nullopt; }
        T value = std::move(items.front());
        items.pop_front();
        not_full.notify_one();
        return value;
    }

    /// Values that are already enqueued can still be popped
    void close() {
        {
            std::scoped_lock lock{mutex};
            closed = true;
        }
        not_full.notify_all();
        not_empty.notify_all();
    }

  private:
    std::size_t             capacity;
    std::mutex              mutex;
    std::condition_variable not_full;
    std::condition_variable not_empty;
    std::deque<T>           items;
    bool                    closed = false;
};

#endif // CHANNEL_HPP
