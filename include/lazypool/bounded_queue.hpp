#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace lazypool {

/**
 * @brief Fixed-capacity FIFO with blocking take and non-blocking put
 *
 * Producers never wait: a put into a full queue is refused and left to the
 * caller to handle.
 */
template <typename T> class BoundedQueue {
  public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    auto operator=(const BoundedQueue&) -> BoundedQueue& = delete;

    /**
     * @brief Append an item unless the queue is full
     *
     * @return false if the queue was full; the item is destroyed
     */
    [[nodiscard]] auto try_put(T item) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest item, waiting while the queue is empty
     */
    [[nodiscard]] auto take() -> T {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty(); });
        return pop_front_locked();
    }

    /**
     * @brief Remove the oldest item, waiting until one arrives or stop is requested
     *
     * An item that is already queued is handed out even if stop was requested.
     */
    [[nodiscard]] auto take(std::stop_token stop) -> std::optional<T> {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait(lock, stop, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        return pop_front_locked();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

  private:
    auto pop_front_locked() -> T {
        T front(std::move(items_.front()));
        items_.pop_front();
        return front;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::deque<T> items_;
};

} // namespace lazypool
