#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <utility>

namespace NM {

/**
 * Bounded least-recently-used map.
 *
 * Both get() and set() mark an entry most recently used. When an insertion
 * takes the size past limit(), the batch() least recently used entries are
 * dropped in one pass, so size() never exceeds limit() + batch().
 *
 * Not synchronized; callers run on the render thread.
 */
template <typename Key, typename T, typename Hash = phmap::Hash<Key>>
class LruCache {
public:
    struct Stats {
        std::uint64_t hits      = 0;
        std::uint64_t misses    = 0;
        std::uint64_t evictions = 0;
    };

    explicit LruCache(std::size_t limit = 500, std::size_t batch = 50)
        : limit_(limit), batch_(batch == 0 ? 1 : batch) {}

    [[nodiscard]] auto get(Key const& key) -> std::optional<T> {
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        order_.splice(order_.end(), order_, it->second);
        return it->second->second;
    }

    auto set(Key const& key, T value) -> void {
        if (auto it = index_.find(key); it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.end(), order_, it->second);
            return;
        }
        order_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(order_.end()));
        if (order_.size() > limit_) {
            evict_batch();
        }
    }

    auto erase(Key const& key) -> bool {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    [[nodiscard]] auto contains(Key const& key) const -> bool { return index_.contains(key); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return order_.size(); }
    [[nodiscard]] auto limit() const noexcept -> std::size_t { return limit_; }
    [[nodiscard]] auto batch() const noexcept -> std::size_t { return batch_; }
    [[nodiscard]] auto stats() const noexcept -> Stats const& { return stats_; }

    // Shrinks immediately when the new limit is below the current size.
    auto reconfigure(std::size_t limit, std::size_t batch) -> void {
        limit_ = limit;
        batch_ = batch == 0 ? 1 : batch;
        while (order_.size() > limit_) {
            evict_batch();
        }
    }

    auto clear() -> void {
        order_.clear();
        index_.clear();
    }

    auto resetStats() -> void { stats_ = Stats{}; }

private:
    using Order = std::list<std::pair<Key, T>>;

    auto evict_batch() -> void {
        for (std::size_t i = 0; i < batch_ && !order_.empty(); ++i) {
            index_.erase(order_.front().first);
            order_.pop_front();
            ++stats_.evictions;
        }
    }

    std::size_t limit_;
    std::size_t batch_;
    Order       order_; // front is least recently used
    phmap::flat_hash_map<Key, typename Order::iterator, Hash> index_;
    Stats       stats_;
};

} // namespace NM
