#pragma once

#include <concepts>
#include <type_traits>

namespace lazypool {

/**
 * @brief A value that can live in a pool slot
 *
 * The value is built in place from the generator's result and never moves
 * again while its slot exists.
 */
template <typename T>
concept Poolable = std::move_constructible<T> && std::destructible<T>;

/**
 * @brief Slot generator: () -> T
 *
 * Stored as std::function, so it must be copyable.
 */
template <typename F, typename T>
concept SlotGenerator = std::copy_constructible<F> && std::invocable<F&> &&
                        std::convertible_to<std::invoke_result_t<F&>, T>;

} // namespace lazypool
