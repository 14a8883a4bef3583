#pragma once

#include <memory>

#include <fmt/format.h>

#include "lazypool/concepts.hpp"
#include "lazypool/pool.hpp"
#include "lazypool/pool_config.hpp"
#include "lazypool/result.hpp"
#include "lazypool/unit.hpp"

namespace lazypool {

/**
 * @brief PoolFactory - the only way to construct a Pool
 *
 * Validates the configuration and hands back a shared pool. No value is
 * generated here; the generator first runs when a borrowed item is read.
 */
class PoolFactory {
  public:
    PoolFactory() = delete;

    template <Poolable T, typename Generator>
        requires SlotGenerator<Generator, T>
    [[nodiscard]] static auto create(Generator generator, PoolConfig config = default_config)
        -> Result<std::shared_ptr<Pool<T>>> {

        auto validation = validate_config(config);
        if (validation.is_err()) {
            return Result<std::shared_ptr<Pool<T>>>::err(validation.error());
        }

        auto pool = std::shared_ptr<Pool<T>>(
            new Pool<T>(typename Pool<T>::Generator(std::move(generator)), config));

        return Result<std::shared_ptr<Pool<T>>>::ok(std::move(pool));
    }

  private:
    [[nodiscard]] static auto validate_config(const PoolConfig& config) -> Result<Unit> {
        if (config.pool_size == 0) {
            return Result<Unit>::err("pool_size must be positive");
        }
        return Result<Unit>::ok(unit);
    }
};

/**
 * @brief Create a pool of pool_size lazily generated values
 */
template <Poolable T, typename Generator>
    requires SlotGenerator<Generator, T>
[[nodiscard]] auto make_pool(Generator generator, int pool_size) -> Result<std::shared_ptr<Pool<T>>> {
    if (pool_size <= 0) {
        return Result<std::shared_ptr<Pool<T>>>::err(
            fmt::format("pool_size must be positive, got {}", pool_size));
    }
    return PoolFactory::create<T>(std::move(generator),
                                  default_config.with_pool_size(static_cast<std::size_t>(pool_size)));
}

} // namespace lazypool
