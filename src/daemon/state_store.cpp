#include "state_store.hpp"

#include <algorithm>

StateStore::Transaction::Transaction(StateStore& store)
    : store_(store), lock_(store.mutex_) {}

bool StateStore::Transaction::add_sticky(WindowId id) {
    return store_.sticky_.insert(id).second;
}

bool StateStore::Transaction::remove_sticky(WindowId id) {
    return store_.sticky_.erase(id) > 0;
}

bool StateStore::Transaction::add_staged(WindowId id) {
    return store_.staged_.insert(id).second;
}

bool StateStore::Transaction::remove_staged(WindowId id) {
    return store_.staged_.erase(id) > 0;
}

size_t StateStore::Transaction::commit_staged(const std::vector<WindowId>& ids) {
    size_t moved = 0;
    for (auto id : ids) {
        if (store_.sticky_.erase(id) == 0) continue;
        store_.staged_.insert(id);
        moved++;
    }
    return moved;
}

size_t StateStore::Transaction::commit_unstaged(const std::vector<WindowId>& ids) {
    size_t moved = 0;
    for (auto id : ids) {
        if (store_.staged_.erase(id) == 0) continue;
        store_.sticky_.insert(id);
        moved++;
    }
    return moved;
}

size_t StateStore::Transaction::prune_sticky(const WindowSet& live) {
    return std::erase_if(store_.sticky_, [&live](WindowId id) { return !live.contains(id); });
}

std::vector<WindowId> StateStore::Transaction::sticky() const {
    std::vector<WindowId> ids(store_.sticky_.begin(), store_.sticky_.end());
    std::ranges::sort(ids);
    return ids;
}

std::vector<WindowId> StateStore::Transaction::staged() const {
    std::vector<WindowId> ids(store_.staged_.begin(), store_.staged_.end());
    std::ranges::sort(ids);
    return ids;
}

std::vector<WindowId> StateStore::sticky() {
    return begin().sticky();
}

std::vector<WindowId> StateStore::staged() {
    return begin().staged();
}
