#include <nodememo/cache/ElementCache.hpp>

namespace NM {

namespace {

auto retire(CacheEntry& entry) -> void {
    if (entry.boundary) {
        entry.boundary->retire();
    }
}

} // namespace

auto ElementCache::find(StableKey const& key) -> CacheEntry* {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

auto ElementCache::find(StableKey const& key) const -> CacheEntry const* {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

auto ElementCache::insert(StableKey const& key, CacheEntry entry) -> CacheEntry& {
    auto [it, inserted] = entries_.try_emplace(key, std::move(entry));
    if (!inserted) {
        if (it->second.boundary != entry.boundary) {
            retire(it->second);
        }
        it->second = std::move(entry);
    }
    return it->second;
}

auto ElementCache::erase(StableKey const& key) -> bool {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    retire(it->second);
    entries_.erase(it);
    return true;
}

auto ElementCache::eraseIf(std::function<bool(StableKey const&, CacheEntry const&)> const& predicate)
    -> std::vector<StableKey> {
    std::vector<StableKey> removed;
    for (auto const& [key, entry] : entries_) {
        if (predicate(key, entry)) {
            removed.push_back(key);
        }
    }
    for (auto const& key : removed) {
        erase(key);
    }
    return removed;
}

auto ElementCache::keys() const -> std::vector<StableKey> {
    std::vector<StableKey> result;
    result.reserve(entries_.size());
    for (auto const& [key, entry] : entries_) {
        result.push_back(key);
    }
    return result;
}

auto ElementCache::clear() -> void {
    for (auto& [key, entry] : entries_) {
        retire(entry);
    }
    entries_.clear();
}

} // namespace NM
