#pragma once

#include <cstddef>

namespace lazypool {

/**
 * @brief Immutable pool configuration
 *
 * Builder methods return a modified copy and leave the original untouched.
 */
struct PoolConfig {
    std::size_t pool_size{1};

    [[nodiscard]] constexpr auto with_pool_size(std::size_t n) const -> PoolConfig {
        auto copy = *this;
        copy.pool_size = n;
        return copy;
    }

    constexpr auto operator==(const PoolConfig&) const -> bool = default;
};

inline constexpr PoolConfig default_config{};

} // namespace lazypool
