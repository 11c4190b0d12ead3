/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "SharedResultBuffer.h"
#include <algorithm>
#include <cstring>

namespace OriginVault::Core::Concurrency {

using IO::StorageError;

SharedResultBuffer::SharedResultBuffer(size_t slotCount, size_t payloadCapacity)
    : _payloadCapacity(payloadCapacity) {
    if (slotCount == 0) slotCount = 1;
    _slots.reserve(slotCount);
    _freeList.reserve(slotCount);
    for (size_t i = 0; i < slotCount; ++i) {
        auto slot = std::make_unique<Slot>();
        slot->payload = std::make_unique<std::byte[]>(payloadCapacity);
        _slots.push_back(std::move(slot));
        _freeList.push_back(static_cast<uint32_t>(slotCount - 1 - i));
    }
}

std::optional<uint32_t> SharedResultBuffer::claim(uint64_t requestId, std::chrono::steady_clock::time_point deadline) {
    uint32_t index;
    {
        std::unique_lock<std::mutex> lock(_freeMutex);
        if (!_freeCv.wait_until(lock, deadline, [this] { return !_freeList.empty(); })) {
            return std::nullopt;
        }
        index = _freeList.back();
        _freeList.pop_back();
    }

    Slot& slot = *_slots[index];
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.state = SlotState::Waiting;
    slot.requestId = requestId;
    slot.code = StorageError::None;
    slot.value = 0;
    slot.payloadSize = 0;
    slot.message[0] = '\0';
    return index;
}

void SharedResultBuffer::cancel(uint32_t index, uint64_t requestId) {
    if (index >= _slots.size()) return;
    Slot& slot = *_slots[index];
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.requestId != requestId || slot.state != SlotState::Waiting) return;
        slot.state = SlotState::Free;
    }
    freeSlot(index);
}

CommandResult SharedResultBuffer::wait(uint32_t index, uint64_t requestId, std::chrono::steady_clock::time_point deadline) {
    if (index >= _slots.size()) {
        return CommandResult::failure(StorageError::Misuse, "Invalid result slot");
    }
    Slot& slot = *_slots[index];
    CommandResult result;
    {
        std::unique_lock<std::mutex> lock(slot.mutex);
        if (slot.requestId != requestId) {
            return CommandResult::failure(StorageError::Misuse, "Result slot is owned by another request");
        }
        bool ready = slot.cv.wait_until(lock, deadline, [&slot] { return slot.state == SlotState::Ready; });
        if (!ready) {
            slot.state = SlotState::Abandoned;
            return CommandResult::failure(StorageError::IOTimeout, "Timed out waiting for the async proxy");
        }

        result.error.code = slot.code;
        result.error.message = slot.message;
        result.value = slot.value;
        result.payload.assign(slot.payload.get(), slot.payload.get() + slot.payloadSize);
        slot.state = SlotState::Free;
    }
    freeSlot(index);
    return result;
}

bool SharedResultBuffer::publish(uint32_t index, uint64_t requestId, const CommandResult& result) {
    if (index >= _slots.size()) return false;
    Slot& slot = *_slots[index];
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.requestId != requestId) return false;
        if (slot.state == SlotState::Abandoned) {
            slot.state = SlotState::Free;
        } else if (slot.state == SlotState::Waiting) {
            slot.code = result.error.code;
            slot.value = result.value;
            slot.payloadSize = static_cast<uint32_t>(std::min(result.payload.size(), _payloadCapacity));
            if (slot.payloadSize > 0) {
                std::memcpy(slot.payload.get(), result.payload.data(), slot.payloadSize);
            }
            const size_t n = std::min(result.error.message.size(), kMessageCapacity - 1);
            std::memcpy(slot.message, result.error.message.data(), n);
            slot.message[n] = '\0';
            slot.state = SlotState::Ready;
            slot.cv.notify_all();
            return true;
        } else {
            return false;
        }
    }
    freeSlot(index);
    return false;
}

bool SharedResultBuffer::isAbandoned(uint32_t index, uint64_t requestId) const {
    if (index >= _slots.size()) return false;
    const Slot& slot = *_slots[index];
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.requestId == requestId && slot.state == SlotState::Abandoned;
}

bool SharedResultBuffer::discard(uint32_t index, uint64_t requestId) {
    if (index >= _slots.size()) return false;
    Slot& slot = *_slots[index];
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.requestId != requestId || slot.state != SlotState::Abandoned) return false;
        slot.state = SlotState::Free;
    }
    freeSlot(index);
    return true;
}

size_t SharedResultBuffer::freeCount() const {
    std::lock_guard<std::mutex> lock(_freeMutex);
    return _freeList.size();
}

void SharedResultBuffer::freeSlot(uint32_t index) {
    {
        std::lock_guard<std::mutex> lock(_freeMutex);
        _freeList.push_back(index);
    }
    _freeCv.notify_one();
}

} // namespace OriginVault::Core::Concurrency
