#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "lazypool/concepts.hpp"

namespace lazypool {

/**
 * @brief One unit of pool capacity: a memoized generator
 *
 * The generator runs on the first get() and its result is cached for the
 * lifetime of the slot. There is no locking here; a slot has exactly one
 * borrower at a time and the pool's queue mutex orders the hand-over between
 * borrowers.
 */
template <Poolable T> class LazySlot {
  public:
    using Generator = std::function<T()>;

    explicit LazySlot(std::shared_ptr<const Generator> generator)
        : generator_(std::move(generator)) {}

    LazySlot(const LazySlot&) = delete;
    auto operator=(const LazySlot&) -> LazySlot& = delete;

    /**
     * @brief Cached value, generating it on first use
     *
     * A throwing generator leaves the slot empty; the next call tries again.
     */
    [[nodiscard]] auto get() -> T& {
        if (!value_) {
            value_.emplace((*generator_)());
        }
        return *value_;
    }

    [[nodiscard]] auto is_generated() const -> bool { return value_.has_value(); }

  private:
    std::shared_ptr<const Generator> generator_;
    std::optional<T> value_;
};

} // namespace lazypool
