#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace sky::sim {

/// Recycler for mutable entity records.
///
/// T must expose a `u32 pool_slot` member; the pool owns that field and uses
/// it to map a record back to its slot without a hash lookup. Records are
/// heap-allocated once and keep a stable address for the life of the pool.
template <typename T>
class EntityPool {
public:
    using ResetFn = std::function<void(T&)>;

    EntityPool(ResetFn reset, size_t initial_size, size_t soft_cap,
               std::string name)
        : reset_(std::move(reset)), soft_cap_(soft_cap),
          name_(std::move(name)) {
        slots_.reserve(std::max(initial_size, soft_cap));
        in_use_.reserve(slots_.capacity());
        free_.reserve(slots_.capacity());
        for (size_t i = 0; i < initial_size; ++i) {
            grow();
        }
        // Hand out low slots first.
        std::reverse(free_.begin(), free_.end());
    }

    EntityPool(const EntityPool&) = delete;
    EntityPool& operator=(const EntityPool&) = delete;

    /// Pull a record from the free list, constructing one when empty, and run
    /// the reset function on it.
    T* acquire() {
        if (free_.empty()) {
            grow();
            if (slots_.size() > soft_cap_ && !warned_) {
                warned_ = true;
                spdlog::warn("Pool '{}' grew past soft cap {} (now {})",
                             name_, soft_cap_, slots_.size());
            }
        }
        u32 slot = free_.back();
        free_.pop_back();
        in_use_[slot] = true;
        ++active_;

        T* obj = slots_[slot].get();
        reset_(*obj);
        obj->pool_slot = slot;
        return obj;
    }

    /// Return a record to the free list. Releasing a record that is not
    /// currently in use (double despawn, foreign pointer) does nothing.
    void release(T* obj) {
        if (!owns(obj)) return;
        u32 slot = obj->pool_slot;
        if (!in_use_[slot]) return;
        in_use_[slot] = false;
        --active_;
        free_.push_back(slot);
    }

    /// True if obj is a record this pool handed out (in use or not).
    bool owns(const T* obj) const {
        if (!obj) return false;
        u32 slot = obj->pool_slot;
        return slot < slots_.size() && slots_[slot].get() == obj;
    }

    bool in_use(const T* obj) const { return owns(obj) && in_use_[obj->pool_slot]; }

    size_t active_count() const { return active_; }
    size_t free_count() const { return free_.size(); }
    size_t capacity() const { return slots_.size(); }
    size_t soft_cap() const { return soft_cap_; }
    const std::string& name() const { return name_; }

    /// Visit every record currently handed out.
    template <typename F>
    void for_each_active(F&& fn) {
        for (size_t i = 0; i < slots_.size(); ++i) {
            if (in_use_[i]) fn(*slots_[i]);
        }
    }

    /// Return every in-use record to the free list.
    void release_all() {
        for (size_t i = 0; i < slots_.size(); ++i) {
            if (in_use_[i]) release(slots_[i].get());
        }
    }

private:
    void grow() {
        auto slot = static_cast<u32>(slots_.size());
        slots_.push_back(std::make_unique<T>());
        slots_.back()->pool_slot = slot;
        in_use_.push_back(false);
        free_.push_back(slot);
    }

    ResetFn reset_;
    std::vector<std::unique_ptr<T>> slots_;
    std::vector<bool> in_use_;
    std::vector<u32> free_;
    size_t active_ = 0;
    size_t soft_cap_;
    std::string name_;
    bool warned_ = false;
};

} // namespace sky::sim
