#pragma once

#include <functional>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>

#include "lazypool/concepts.hpp"
#include "lazypool/lazy_slot.hpp"

namespace lazypool {

template <Poolable T> class Pool;

/**
 * @brief Exclusive loan of one pool slot
 *
 * Returned to the pool exactly once: by return_to_pool() or, failing that,
 * by the destructor. Non-copyable, movable. Any use after the return throws
 * std::logic_error.
 */
template <Poolable T> class BorrowedItem {
  public:
    using Slot = LazySlot<T>;
    using Releaser = std::function<void(std::unique_ptr<Slot>, bool discarded)>;

    BorrowedItem(const BorrowedItem&) = delete;
    auto operator=(const BorrowedItem&) -> BorrowedItem& = delete;

    BorrowedItem(BorrowedItem&& other) noexcept
        : slot_(std::move(other.slot_)), releaser_(std::move(other.releaser_)),
          discarded_(other.discarded_) {
        other.releaser_ = nullptr;
    }

    auto operator=(BorrowedItem&& other) noexcept -> BorrowedItem& {
        if (this != &other) {
            release();
            slot_ = std::move(other.slot_);
            releaser_ = std::move(other.releaser_);
            discarded_ = other.discarded_;
            other.releaser_ = nullptr;
        }
        return *this;
    }

    ~BorrowedItem() { release(); }

    /**
     * @brief The pooled value, generated on the first access to this slot
     *
     * After discard() this is still the old value until the item is returned.
     */
    [[nodiscard]] auto get() -> T& { return held_slot("get").get(); }

    auto operator->() -> T* { return &get(); }
    auto operator*() -> T& { return get(); }

    /**
     * @brief Drop this slot's value when the item is returned
     *
     * The pool then receives a fresh slot that regenerates on its next use.
     */
    void discard() {
        held_slot("discard");
        discarded_ = true;
    }

    [[nodiscard]] auto is_discarded() const -> bool { return discarded_; }

    [[nodiscard]] auto is_held() const -> bool { return slot_ != nullptr; }

    void return_to_pool() {
        held_slot("return_to_pool");
        release();
    }

  private:
    friend class Pool<T>;

    BorrowedItem(std::unique_ptr<Slot> slot, Releaser releaser)
        : slot_(std::move(slot)), releaser_(std::move(releaser)) {}

    auto held_slot(const char* operation) -> Slot& {
        if (!slot_) {
            throw std::logic_error(
                fmt::format("BorrowedItem::{} on an item that is no longer held", operation));
        }
        return *slot_;
    }

    void release() {
        if (slot_ && releaser_) {
            auto releaser = std::move(releaser_);
            releaser_ = nullptr;
            releaser(std::move(slot_), discarded_);
        }
    }

    std::unique_ptr<Slot> slot_;
    Releaser releaser_;
    bool discarded_{false};
};

} // namespace lazypool
