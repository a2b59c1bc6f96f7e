#include "daehwa_storage.h"

namespace Daehwa {

LoadResult MemoryStorage::load(const std::string& key, ConversationState& state, std::string& /*error*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        state = ConversationState();
        return LoadResult::Empty;
    }
    state = it->second;
    return LoadResult::Found;
}

bool MemoryStorage::save(const std::string& key, const ConversationState& state, std::string& /*error*/) {
    ConversationState copy = state;
    for (auto& inst : copy.stack) inst.serial = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(copy);
    return true;
}

void MemoryStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace Daehwa
