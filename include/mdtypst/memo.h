#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace mdtypst {

/**
 * Memo - keyed cache with per-key population
 *
 * Lookups of populated keys only take a shared lock. The first caller for a
 * key runs the loader while holding that key's own mutex, so concurrent
 * callers for the same key wait for it instead of loading twice, and callers
 * for other keys are not blocked.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class Memo {
public:
    template<typename Loader>
    Value getOrLoad(const Key& key, Loader&& loader) {
        auto slot = slotFor(key);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!slot->value) {
            slot->value.emplace(loader());
        }
        return *slot->value;
    }

    // Value if already populated, without loading.
    std::optional<Value> peek(const Key& key) const {
        std::shared_ptr<Slot> slot;
        {
            std::shared_lock<std::shared_mutex> lock(_mutex);
            auto it = _slots.find(key);
            if (it == _slots.end()) return std::nullopt;
            slot = it->second;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->value;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        return _slots.size();
    }

private:
    struct Slot {
        std::mutex mutex;
        std::optional<Value> value;
    };

    std::shared_ptr<Slot> slotFor(const Key& key) {
        {
            std::shared_lock<std::shared_mutex> lock(_mutex);
            auto it = _slots.find(key);
            if (it != _slots.end()) return it->second;
        }
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& slot = _slots[key];
        if (!slot) slot = std::make_shared<Slot>();
        return slot;
    }

    mutable std::shared_mutex _mutex;
    std::unordered_map<Key, std::shared_ptr<Slot>, Hash> _slots;
};

} // namespace mdtypst
