#include <catch2/catch_test_macros.hpp>

#include "state_store.hpp"

#include <vector>

TEST_CASE("StateStore", "[state]") {
    StateStore store;

    SECTION("StartsEmpty") {
        REQUIRE(store.sticky().empty());
        REQUIRE(store.staged().empty());
    }

    SECTION("AddStickyReportsNewInsert") {
        auto txn = store.begin();
        REQUIRE(txn.add_sticky(7));
        REQUIRE_FALSE(txn.add_sticky(7));
        REQUIRE(txn.sticky() == std::vector<WindowId>{7});
    }

    SECTION("RemoveStickyReportsPresence") {
        {
            auto txn = store.begin();
            txn.add_sticky(3);
            REQUIRE(txn.remove_sticky(3));
            REQUIRE_FALSE(txn.remove_sticky(3));
        }
        REQUIRE(store.sticky().empty());
    }

    SECTION("SnapshotsAreSorted") {
        {
            auto txn = store.begin();
            for (WindowId id : {42, 5, 19}) txn.add_sticky(id);
        }
        REQUIRE(store.sticky() == std::vector<WindowId>{5, 19, 42});
    }

    SECTION("CommitStagedMovesOnlyStickyIds") {
        auto txn = store.begin();
        txn.add_sticky(1);
        txn.add_sticky(2);
        REQUIRE(txn.commit_staged({1, 9}) == 1);
        REQUIRE(txn.sticky() == std::vector<WindowId>{2});
        REQUIRE(txn.staged() == std::vector<WindowId>{1});
        REQUIRE_FALSE(txn.is_sticky(1));
        REQUIRE(txn.is_staged(1));
    }

    SECTION("CommitUnstagedMovesOnlyStagedIds") {
        auto txn = store.begin();
        txn.add_staged(4);
        txn.add_staged(6);
        REQUIRE(txn.commit_unstaged({6, 8}) == 1);
        REQUIRE(txn.staged() == std::vector<WindowId>{4});
        REQUIRE(txn.sticky() == std::vector<WindowId>{6});
    }

    SECTION("PruneKeepsLiveWindows") {
        auto txn = store.begin();
        txn.add_sticky(5);
        txn.add_sticky(9);
        txn.add_staged(11);
        REQUIRE(txn.prune_sticky(WindowSet{5, 11}) == 1);
        REQUIRE(txn.sticky() == std::vector<WindowId>{5});
        // Staged windows are never pruned
        REQUIRE(txn.staged() == std::vector<WindowId>{11});
    }
}
