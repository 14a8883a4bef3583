#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <type_traits>

#include <fmt/format.h>

#include "lazypool/borrowed_item.hpp"
#include "lazypool/bounded_queue.hpp"
#include "lazypool/concepts.hpp"
#include "lazypool/lazy_slot.hpp"
#include "lazypool/pool_config.hpp"
#include "lazypool/result.hpp"
#include "lazypool/unit.hpp"

namespace lazypool {

class PoolFactory;

/**
 * @brief Pool statistics (read-only snapshot, may be stale on return)
 */
struct PoolStats {
    std::size_t available;
    std::size_t in_use;
    std::size_t total_generated;
    std::size_t capacity;

    constexpr auto operator==(const PoolStats&) const -> bool = default;
};

/**
 * @brief Fixed-capacity blocking pool of lazily generated values
 *
 * Holds exactly config().pool_size slots. A slot is either queued here or
 * owned by one BorrowedItem. Values are generated on first access through a
 * borrowed item and kept for the life of the slot; discard() replaces the
 * slot with a fresh one when the item comes back.
 *
 * Thread-safe. Every checked-out item keeps its pool alive, so items may
 * outlive the caller's last shared_ptr to the pool.
 */
template <Poolable T> class Pool : public std::enable_shared_from_this<Pool<T>> {
  public:
    using Generator = std::function<T()>;
    using Slot = LazySlot<T>;

    Pool(const Pool&) = delete;
    auto operator=(const Pool&) -> Pool& = delete;
    Pool(Pool&&) = delete;
    auto operator=(Pool&&) -> Pool& = delete;

    ~Pool() = default;

    /**
     * @brief Borrow a slot, blocking until one is free
     */
    [[nodiscard]] auto checkout() -> BorrowedItem<T> { return wrap_slot(slots_.take()); }

    /**
     * @brief Borrow a slot, blocking until one is free or stop is requested
     *
     * A wait ended by the stop token comes back as Err rather than an
     * exception. No slot is taken in that case. A slot that is already free
     * is handed out even if stop was requested.
     */
    [[nodiscard]] auto checkout(std::stop_token stop) -> Result<BorrowedItem<T>> {
        auto slot = slots_.take(std::move(stop));
        if (!slot) {
            return Result<BorrowedItem<T>>::err("checkout cancelled while waiting for a free slot");
        }
        return Result<BorrowedItem<T>>::ok(wrap_slot(std::move(*slot)));
    }

    /**
     * @brief Run f on a borrowed value (bracket pattern)
     *
     * The slot goes back to the pool on every exit path, including an
     * exception thrown by f.
     */
    template <typename F> auto with_item(F&& f) -> std::invoke_result_t<F, T&> {
        auto item = checkout();
        return std::invoke(std::forward<F>(f), item.get());
    }

    /**
     * @brief Cancellable bracket; Err if stop is requested before a slot frees up
     */
    template <typename F>
    auto with_item(std::stop_token stop, F&& f)
        -> Result<std::conditional_t<std::is_void_v<std::invoke_result_t<F, T&>>,
                                     Unit,
                                     std::invoke_result_t<F, T&>>> {
        using RawR = std::invoke_result_t<F, T&>;
        using R = std::conditional_t<std::is_void_v<RawR>, Unit, RawR>;

        auto checked_out = checkout(std::move(stop));
        if (checked_out.is_err()) {
            return Result<R>::err(std::move(checked_out).error());
        }

        auto item = std::move(checked_out).value();
        if constexpr (std::is_void_v<RawR>) {
            std::invoke(std::forward<F>(f), item.get());
            return Result<R>::ok(unit);
        } else {
            return Result<R>::ok(std::invoke(std::forward<F>(f), item.get()));
        }
    }

    [[nodiscard]] auto available() const -> std::size_t { return slots_.size(); }

    [[nodiscard]] auto capacity() const -> std::size_t { return slots_.capacity(); }

    [[nodiscard]] auto stats() const -> PoolStats {
        const auto queued = slots_.size();
        return PoolStats{
            .available = queued,
            .in_use = slots_.capacity() - queued,
            .total_generated = total_generated_->load(std::memory_order_relaxed),
            .capacity = slots_.capacity(),
        };
    }

    [[nodiscard]] auto config() const -> const PoolConfig& { return config_; }

  private:
    friend class PoolFactory;

    // Slots share the counting generator, so it owns the counter it bumps.
    Pool(Generator generator, PoolConfig config)
        : total_generated_(std::make_shared<std::atomic<std::size_t>>(0)),
          generator_(std::make_shared<const Generator>(
              [generated = total_generated_, generator = std::move(generator)]() -> T {
                  T value = generator();
                  generated->fetch_add(1, std::memory_order_relaxed);
                  return value;
              })),
          config_(config), slots_(config.pool_size) {
        for (std::size_t i = 0; i < config_.pool_size; ++i) {
            put_back(make_slot());
        }
    }

    auto make_slot() const -> std::unique_ptr<Slot> { return std::make_unique<Slot>(generator_); }

    auto wrap_slot(std::unique_ptr<Slot> slot) -> BorrowedItem<T> {
        auto releaser = [self = this->shared_from_this()](std::unique_ptr<Slot> s, bool discarded) {
            self->do_release(std::move(s), discarded);
        };
        return BorrowedItem<T>(std::move(slot), std::move(releaser));
    }

    void do_release(std::unique_ptr<Slot> slot, bool discarded) {
        if (discarded) {
            slot = make_slot();
        }
        put_back(std::move(slot));
    }

    // A full queue means more slots came back than were handed out.
    void put_back(std::unique_ptr<Slot> slot) {
        if (!slots_.try_put(std::move(slot))) {
            throw std::logic_error(
                fmt::format("slot returned to a full pool (capacity {})", slots_.capacity()));
        }
    }

    std::shared_ptr<std::atomic<std::size_t>> total_generated_;
    std::shared_ptr<const Generator> generator_;
    PoolConfig config_;
    BoundedQueue<std::unique_ptr<Slot>> slots_;
};

} // namespace lazypool
