#pragma once

#include "types.hpp"

#include <mutex>
#include <vector>

// Owns the sticky and staged sets. A single mutex guards both, and a
// Transaction holds it for a whole transition so no reader ever sees a window
// in both sets or, mid-transition, in neither.
class StateStore {
public:
    class Transaction {
    public:
        explicit Transaction(StateStore& store);

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        bool is_sticky(WindowId id) const { return store_.sticky_.contains(id); }
        bool is_staged(WindowId id) const { return store_.staged_.contains(id); }

        // Returns true if newly inserted.
        bool add_sticky(WindowId id);
        // Returns true if it was present.
        bool remove_sticky(WindowId id);
        bool add_staged(WindowId id);
        bool remove_staged(WindowId id);

        // Moves each id that is currently in the source set.
        size_t commit_staged(const std::vector<WindowId>& ids);
        size_t commit_unstaged(const std::vector<WindowId>& ids);

        // Keeps only sticky ids present in `live`. Returns the number removed.
        size_t prune_sticky(const WindowSet& live);

        std::vector<WindowId> sticky() const;
        std::vector<WindowId> staged() const;

    private:
        StateStore& store_;
        std::unique_lock<std::mutex> lock_;
    };

    StateStore() = default;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    Transaction begin() { return Transaction(*this); }

    // Consistent snapshots, each taken under the guard.
    std::vector<WindowId> sticky();
    std::vector<WindowId> staged();

private:
    std::mutex mutex_;
    WindowSet sticky_;
    WindowSet staged_;
};
