#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "state_store.hpp"
#include "transition_engine.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("Concurrent transitions keep the sets disjoint", "[engine][concurrency]") {
    StateStore store;
    FakeRegistry registry;
    FakeExecutor executor;
    TransitionEngine engine(store, registry, executor, "stage");

    constexpr WindowId WINDOWS = 8;
    for (WindowId id = 1; id <= WINDOWS; ++id) registry.windows.insert(id);
    executor.failing = {3, 6};
    {
        auto txn = store.begin();
        for (WindowId id = 1; id <= WINDOWS; ++id) txn.add_sticky(id);
    }

    std::atomic<bool> stop{false};
    std::atomic<int> violations{0};

    // Every snapshot must show each window in exactly one set.
    std::jthread observer([&] {
        while (!stop) {
            auto txn = store.begin();
            for (WindowId id = 1; id <= WINDOWS; ++id) {
                if (txn.is_sticky(id) == txn.is_staged(id)) violations++;
            }
        }
    });

    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                WindowId id = static_cast<WindowId>((i + t) % WINDOWS) + 1;
                switch ((i + t) % 4) {
                    case 0: (void)engine.stage(id); break;
                    case 1: (void)engine.unstage(id, 2); break;
                    case 2: (void)engine.stage_all(); break;
                    case 3: (void)engine.unstage_all(2); break;
                }
            }
        });
    }
    workers.clear();
    stop = true;
    observer.join();

    REQUIRE(violations == 0);

    auto sticky = store.sticky();
    auto staged = store.staged();
    REQUIRE(sticky.size() + staged.size() == WINDOWS);
    // Windows whose moves always fail can never leave the sticky set.
    REQUIRE(std::ranges::find(sticky, 3) != sticky.end());
    REQUIRE(std::ranges::find(sticky, 6) != sticky.end());
}
