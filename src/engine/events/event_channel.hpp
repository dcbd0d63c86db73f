#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "event.hpp"

namespace Webscout {
namespace Engine {

/**
 * One-way queue from the crawler to a reporter. Producers never block: when
 * the buffer is full the oldest queued event is discarded and counted.
 * After close(), pop() drains what is left and then returns std::nullopt.
 */
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity);

    void push(CrawlEvent event);
    void close();

    // Blocks until an event arrives or the channel is closed and empty.
    std::optional<CrawlEvent> pop();
    std::optional<CrawlEvent> try_pop_for(std::chrono::milliseconds wait);

    EventSink sink();

    std::size_t dropped() const;
    std::size_t size() const;
    bool        closed() const;

private:
    std::size_t             capacity_;
    std::size_t             dropped_ = 0;
    bool                    closed_  = false;
    std::deque<CrawlEvent>  queue_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
};

}  // namespace Engine
}  // namespace Webscout
