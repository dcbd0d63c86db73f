#include "event_channel.hpp"

namespace Webscout {
namespace Engine {

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void EventChannel::push(CrawlEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<CrawlEvent> EventChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
        return std::nullopt;

    CrawlEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<CrawlEvent> EventChannel::try_pop_for(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, wait, [this] { return !queue_.empty() || closed_; }))
        return std::nullopt;
    if (queue_.empty())
        return std::nullopt;

    CrawlEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

EventSink EventChannel::sink() {
    return [this](const CrawlEvent& event) { push(event); };
}

std::size_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace Engine
}  // namespace Webscout
