#include <atomic>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "lazypool/pool_factory.hpp"

using namespace lazypool;

// =============================================================================
// Example 1: Lazily opened connections
// =============================================================================

struct Connection {
    std::string host;
    int id;
    int queries{0};

    Connection(std::string h, int i) : host(std::move(h)), id(i) {
        std::cout << "  (opening connection #" << id << ")" << std::endl;
    }
};

auto demo_lazy_connections() -> void {
    std::cout << "=== Lazy Connection Pool Demo ===" << std::endl;

    std::atomic<int> next_id{0};
    auto open = [&next_id] { return Connection{"localhost:5432", ++next_id}; };

    make_pool<Connection>(open, 3).match(
        [&next_id](auto pool) {
            std::cout << "Pool created. available=" << pool->available()
                      << ", connections opened=" << next_id.load() << std::endl;

            // Scoped acquisition: the item goes back when it leaves the block
            {
                auto conn = pool->checkout();
                ++conn->queries;
                std::cout << "Using connection #" << conn->id << " to " << conn->host
                          << std::endl;
            }

            // Recycled slot: same connection, nothing new opened
            pool->with_item([](Connection& conn) {
                ++conn.queries;
                std::cout << "Connection #" << conn.id << " has served " << conn.queries
                          << " queries" << std::endl;
            });

            auto stats = pool->stats();
            std::cout << "available=" << stats.available << ", in_use=" << stats.in_use
                      << ", generated=" << stats.total_generated << std::endl;
        },
        [](const auto& err) { std::cout << "Failed to create pool: " << err << std::endl; });

    std::cout << std::endl;
}

// =============================================================================
// Example 2: Discarding a broken value
// =============================================================================

auto demo_discard() -> void {
    std::cout << "=== Discard Demo ===" << std::endl;

    int next_id = 0;
    auto open = [&next_id] { return Connection{"db.internal:5432", ++next_id}; };

    make_pool<Connection>(open, 1).match(
        [](auto pool) {
            auto conn = pool->checkout();
            std::cout << "Connection #" << conn->id << " went bad, discarding" << std::endl;
            conn.discard();
            conn.return_to_pool();

            std::cout << "After discard: available=" << pool->available()
                      << ", generated=" << pool->stats().total_generated << std::endl;

            pool->with_item([](Connection& fresh) {
                std::cout << "Replacement is connection #" << fresh.id << std::endl;
            });
        },
        [](const auto& err) { std::cout << "Failed: " << err << std::endl; });

    std::cout << std::endl;
}

// =============================================================================
// Example 3: Contended checkout across threads
// =============================================================================

struct Scratch {
    int id;
    std::vector<char> buffer;

    explicit Scratch(int i) : id(i), buffer(1 << 16) {}
};

auto demo_contended_pool() -> void {
    std::cout << "=== Contended Pool Demo ===" << std::endl;

    std::atomic<int> next_id{0};
    auto factory = [&next_id] { return Scratch{++next_id}; };

    make_pool<Scratch>(factory, 2).match(
        [](auto pool) {
            std::vector<std::thread> threads;

            // Six threads share two slots; checkout blocks until one is free
            for (int i = 0; i < 6; ++i) {
                threads.emplace_back([pool, i]() {
                    pool->with_item([i](Scratch& s) {
                        s.buffer[0] = static_cast<char>(i);
                        std::cout << "Thread " << i << " using scratch #" << s.id << std::endl;
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    });
                });
            }

            for (auto& t : threads) {
                t.join();
            }

            std::cout << "All threads completed. Scratch buffers generated: "
                      << pool->stats().total_generated << std::endl;
        },
        [](const auto& err) { std::cout << "Failed: " << err << std::endl; });

    std::cout << std::endl;
}

// =============================================================================
// Example 4: Cancelling a blocked checkout
// =============================================================================

auto demo_cancellation() -> void {
    std::cout << "=== Cancellation Demo ===" << std::endl;

    auto factory = [] { return 7; };

    make_pool<int>(factory, 1)
        .and_then([](auto pool) {
            auto held = pool->checkout();

            std::stop_source stop;
            std::jthread canceller([&stop] {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                stop.request_stop();
            });

            return pool->with_item(stop.get_token(), [](int& n) { return n * 2; });
        })
        .match([](int doubled) { std::cout << "Computed " << doubled << std::endl; },
               [](const std::string& err) { std::cout << "Gave up: " << err << std::endl; });

    std::cout << std::endl;
}

// =============================================================================
// Main
// =============================================================================

auto main() -> int {
    demo_lazy_connections();
    demo_discard();
    demo_contended_pool();
    demo_cancellation();

    return 0;
}
