/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file SlotPool.h
 * @brief Growable slot table with generation-based handle validation
 *
 * SlotPool provides the common infrastructure for slot-based resource pools:
 * - Slot storage with stable addresses (slots never move once created)
 * - Generation counters for stale handle detection
 * - Free list management for O(1) allocation
 * - Growing and retiring capacity at runtime
 *
 * Every slot is in one of three states. Free slots are part of the capacity and can be
 * allocated; active slots are allocated; retired slots have been removed from the
 * capacity and are reused first when the pool grows again.
 *
 * @code
 * struct FileSlotData {
 *     std::unique_ptr<SyncAccessHandle> handle;
 *     std::string name;
 * };
 *
 * SlotPool<FileSlotData> pool(6);
 *
 * auto result = pool.allocate();
 * if (result) {
 *     result->data.name = "/foo.db";
 *     SlotHandle h = result->handle;
 *     // ...
 *     pool.release(h);     // generation bumps; h is now stale
 * }
 * @endcode
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>
#include <vector>
#include "../CoreCommon.h"

namespace OriginVault::Core {

/**
 * @brief Generation counter for a single slot
 *
 * Starts at 1; 0 is reserved for "never allocated" so a default SlotHandle is never valid.
 */
struct SlotGeneration
{
    std::atomic<uint32_t> value{1};

    SlotGeneration() noexcept = default;
    SlotGeneration(const SlotGeneration&) = delete;
    SlotGeneration& operator=(const SlotGeneration&) = delete;

    [[nodiscard]] uint32_t current() const noexcept {
        return value.load(std::memory_order_acquire);
    }

    // Invalidates every handle stamped with the previous value; skips 0 on wrap-around
    void increment() noexcept {
        uint32_t next = value.load(std::memory_order_relaxed) + 1;
        if (next == 0) next = 1;
        value.store(next, std::memory_order_release);
    }
};

/**
 * @brief Index plus generation identifying one allocation of a slot
 */
struct SlotHandle
{
    uint32_t index = std::numeric_limits<uint32_t>::max();
    uint32_t generation = 0;

    [[nodiscard]] bool valid() const noexcept { return generation != 0; }
    bool operator==(const SlotHandle& other) const noexcept {
        return index == other.index && generation == other.generation;
    }
};

/**
 * @brief Slot-based pool with generation-based handle validation
 *
 * @tparam SlotData User-defined data stored in each slot (default-constructed)
 *
 * Thread Safety:
 * - All public methods are thread-safe (protected by internal mutex)
 * - Callbacks run under the pool mutex and must not call back into the pool
 */
template<typename SlotData>
class SlotPool {
public:
    enum class State : uint8_t { Free, Active, Retired };

    struct Slot {
        SlotGeneration generation;
        SlotData data;
        State state = State::Free;
    };

    struct AllocResult {
        SlotHandle handle;
        SlotData& data;
    };

    explicit SlotPool(size_t capacity = 0) {
        grow(capacity);
    }

    /**
     * @brief Adds capacity, reusing retired slots before creating new ones
     * @param count Number of free slots to add
     * @return Indices of the slots that became free, in allocation order
     */
    std::vector<uint32_t> grow(size_t count) {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<uint32_t> added;
        added.reserve(count);
        for (size_t i = 0; i < _slots.size() && added.size() < count; ++i) {
            if (_slots[i].state == State::Retired) {
                _slots[i].state = State::Free;
                added.push_back(static_cast<uint32_t>(i));
            }
        }
        while (added.size() < count) {
            _slots.emplace_back();
            added.push_back(static_cast<uint32_t>(_slots.size() - 1));
        }
        // Push in reverse so the lowest new index is allocated first (LIFO free list)
        for (auto it = added.rbegin(); it != added.rend(); ++it) {
            _freeList.push_back(*it);
        }
        _capacity += count;
        return added;
    }

    /**
     * @brief Removes free slots from the capacity
     *
     * @param count Number of free slots to retire
     * @param fn Callback receiving (index, SlotData&) for each retired slot
     * @return false without retiring anything when fewer than count slots are free
     */
    template<typename Fn>
    bool retireFree(size_t count, Fn&& fn) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_freeList.size() < count) return false;
        for (size_t i = 0; i < count; ++i) {
            uint32_t index = _freeList.back();
            _freeList.pop_back();
            Slot& slot = _slots[index];
            slot.state = State::Retired;
            slot.generation.increment();
            fn(index, slot.data);
        }
        ORIGINVAULT_ASSERT(_capacity >= count, "Retiring more slots than the capacity holds");
        _capacity -= count;
        return true;
    }

    /**
     * @brief Allocates a slot from the pool
     *
     * @return Optional containing (handle, data reference), or nullopt if the pool is full
     */
    [[nodiscard]] std::optional<AllocResult> allocate() {
        std::lock_guard<std::mutex> lock(_mutex);

        if (_freeList.empty()) {
            return std::nullopt;
        }

        uint32_t index = _freeList.back();
        _freeList.pop_back();

        Slot& slot = _slots[index];
        slot.state = State::Active;
        ++_activeCount;

        return AllocResult{SlotHandle{index, slot.generation.current()}, slot.data};
    }

    /**
     * @brief Allocates a specific free slot
     *
     * Used when persisted state dictates which slot holds which resource.
     * @return Optional handle, or nullopt if the slot is not free
     */
    [[nodiscard]] std::optional<SlotHandle> allocateAt(uint32_t index) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (index >= _slots.size() || _slots[index].state != State::Free) return std::nullopt;
        for (auto it = _freeList.begin(); it != _freeList.end(); ++it) {
            if (*it == index) {
                _freeList.erase(it);
                break;
            }
        }
        _slots[index].state = State::Active;
        ++_activeCount;
        return SlotHandle{index, _slots[index].generation.current()};
    }

    /**
     * @brief Releases a slot back to the pool
     *
     * Increments the slot's generation to invalidate stale handles.
     * @return false if the handle was stale or the slot was not active
     */
    bool release(SlotHandle handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!isValidLocked(handle)) return false;

        Slot& slot = _slots[handle.index];
        slot.generation.increment();
        slot.state = State::Free;
        ORIGINVAULT_ASSERT(_activeCount > 0, "Active count underflow");
        --_activeCount;
        _freeList.push_back(handle.index);
        return true;
    }

    [[nodiscard]] bool isValid(SlotHandle handle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return isValidLocked(handle);
    }

    /**
     * @brief Returns the slot data for a live handle
     * @return Pointer to slot data, or nullptr if the handle is stale
     */
    [[nodiscard]] SlotData* getIfValid(SlotHandle handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        return isValidLocked(handle) ? &_slots[handle.index].data : nullptr;
    }

    /**
     * @brief Gets a slot's data by index (no validation)
     */
    [[nodiscard]] SlotData& at(uint32_t index) {
        std::lock_guard<std::mutex> lock(_mutex);
        return _slots[index].data;
    }

    [[nodiscard]] const SlotData& at(uint32_t index) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _slots[index].data;
    }

    [[nodiscard]] State state(uint32_t index) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return index < _slots.size() ? _slots[index].state : State::Retired;
    }

    [[nodiscard]] uint32_t generation(uint32_t index) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return index < _slots.size() ? _slots[index].generation.current() : 0;
    }

    // Statistics
    [[nodiscard]] size_t capacity() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _capacity;
    }
    [[nodiscard]] size_t activeCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _activeCount;
    }
    [[nodiscard]] size_t freeCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _freeList.size();
    }

    /**
     * @brief Iterates over all active slots
     *
     * @param fn Callback receiving (SlotHandle, SlotData&) for each active slot
     */
    template<typename Fn>
    void forEachActive(Fn&& fn) {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < _slots.size(); ++i) {
            if (_slots[i].state == State::Active) {
                fn(SlotHandle{static_cast<uint32_t>(i), _slots[i].generation.current()}, _slots[i].data);
            }
        }
    }

    template<typename Fn>
    void forEachActive(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < _slots.size(); ++i) {
            if (_slots[i].state == State::Active) {
                fn(SlotHandle{static_cast<uint32_t>(i), _slots[i].generation.current()}, _slots[i].data);
            }
        }
    }

    /**
     * @brief Iterates over every slot that is part of the capacity (free or active)
     *
     * @param fn Callback receiving (index, State, SlotData&)
     */
    template<typename Fn>
    void forEachInCapacity(Fn&& fn) {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < _slots.size(); ++i) {
            if (_slots[i].state != State::Retired) {
                fn(static_cast<uint32_t>(i), _slots[i].state, _slots[i].data);
            }
        }
    }

private:
    bool isValidLocked(SlotHandle handle) const {
        if (handle.index >= _slots.size()) return false;
        const Slot& slot = _slots[handle.index];
        return slot.state == State::Active && slot.generation.current() == handle.generation;
    }

    std::deque<Slot> _slots;
    std::vector<uint32_t> _freeList;
    size_t _capacity = 0;
    size_t _activeCount = 0;
    mutable std::mutex _mutex;
};

} // namespace OriginVault::Core
