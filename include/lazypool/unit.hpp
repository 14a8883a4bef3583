#pragma once

namespace lazypool {

/**
 * @brief Unit type - the value of a bracket call whose callback returns void
 *
 * Pool::with_item(stop_token, f) yields Result<Unit> for a void f, and
 * PoolFactory's config check yields Result<Unit>.
 */
struct Unit {
    constexpr auto operator==(const Unit&) const -> bool = default;
};

inline constexpr Unit unit{};

} // namespace lazypool
