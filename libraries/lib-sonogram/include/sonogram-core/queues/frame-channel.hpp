// Bounded blocking queue with close semantics.
// Inspired by https://www.justsoftwaresolutions.co.uk/threading/implementing-a-thread-safe-queue-using-condition-variables.html

#pragma once

#ifndef sonogram_frame_channel_hpp
#define sonogram_frame_channel_hpp

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace sonogram
{
    // Single producer, single consumer. `send` blocks while the channel holds
    // `capacity` items; the consumer side has a non-blocking `try_receive` for the
    // render loop and a blocking `receive` for everything else. Items come out in
    // the order they went in. After `close`, sends fail and queued items can still
    // be drained.
    template<typename T>
    class frame_channel
    {
        std::deque<T> queue;
        const size_t bound;
        bool closed{ false };

        mutable std::mutex mutex;
        std::condition_variable not_full;
        std::condition_variable not_empty;

        frame_channel(const frame_channel &) = delete;
        frame_channel & operator= (const frame_channel &) = delete;

        template<typename Predicate>
        bool send_impl(T && value, Predicate abandoned)
        {
            std::unique_lock<std::mutex> lock(mutex);
            not_full.wait(lock, [&]() { return closed || abandoned() || queue.size() < bound; });
            if (closed || abandoned()) return false;
            queue.push_back(std::move(value));
            lock.unlock();
            not_empty.notify_one();
            return true;
        }

    public:

        explicit frame_channel(size_t capacity) : bound(capacity)
        {
            if (capacity == 0) throw std::invalid_argument("frame_channel capacity must be at least 1");
        }

        // Returns false if the channel is closed, before or while waiting for space
        bool send(T && value)
        {
            return send_impl(std::move(value), []() { return false; });
        }

        // As above, and also gives up once `cancel` is set. Whoever sets the flag
        // must call `wake_producer()` to release a sender that is already waiting.
        bool send(T && value, const std::atomic<bool> & cancel)
        {
            return send_impl(std::move(value), [&cancel]() { return cancel.load(std::memory_order_acquire); });
        }

        // Never blocks
        std::optional<T> try_receive()
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (queue.empty()) return std::nullopt;
            T value = std::move(queue.front());
            queue.pop_front();
            lock.unlock();
            not_full.notify_one();
            return value;
        }

        // Blocks until an item arrives; empty only once the channel is closed and drained
        std::optional<T> receive()
        {
            std::unique_lock<std::mutex> lock(mutex);
            not_empty.wait(lock, [this]() { return closed || !queue.empty(); });
            if (queue.empty()) return std::nullopt;
            T value = std::move(queue.front());
            queue.pop_front();
            lock.unlock();
            not_full.notify_one();
            return value;
        }

        void close()
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                closed = true;
            }
            not_full.notify_all();
            not_empty.notify_all();
        }

        void wake_producer()
        {
            // Taking the lock orders the wakeup after the waiter's predicate check
            { std::lock_guard<std::mutex> lock(mutex); }
            not_full.notify_all();
        }

        bool is_closed() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return closed;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return queue.empty();
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return queue.size();
        }

        size_t capacity() const { return bound; }
    };

} // end namespace sonogram

#endif // end sonogram_frame_channel_hpp
