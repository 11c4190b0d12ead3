/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file SharedResultBuffer.h
 * @brief Fixed set of result cells shared between requesters and the async proxy
 *
 * The buffer is allocated once when the proxy starts and reused for every command. A
 * requester claims a slot, sends a command naming the slot, then blocks in wait() until the
 * proxy publishes into it. Each slot carries its own mutex and condition variable, so a
 * publish wakes exactly the requester that owns the slot.
 *
 * Slot lifecycle:
 * @code
 *   Free --claim--> Waiting --publish--> Ready --wait returns--> Free
 *                      |
 *                      +--wait times out--> Abandoned --publish/discard--> Free
 * @endcode
 *
 * A slot abandoned by a timed-out requester stays reserved until the proxy publishes (and
 * the late result is dropped), so it can never be handed to a new request while a stale
 * result is still on its way.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>
#include "../Storage/StorageError.h"

namespace OriginVault::Core::Concurrency {

/**
 * @brief Outcome of one proxied command, the proxy-path analogue of StorageErrorInfo
 */
struct CommandResult {
    IO::StorageErrorInfo error;          ///< code None on success
    int64_t value = 0;                   ///< bytes read/written, size, 0/1 flags, next cursor
    std::vector<std::byte> payload;      ///< data for Read and List

    bool ok() const noexcept { return error.code == IO::StorageError::None; }
    IO::StorageError code() const noexcept { return error.code; }

    static CommandResult failure(IO::StorageError code, std::string message, std::string path = {}) {
        CommandResult r;
        r.error.code = code;
        r.error.message = std::move(message);
        r.error.path = std::move(path);
        return r;
    }
};

class SharedResultBuffer {
public:
    enum class SlotState : uint8_t { Free, Waiting, Ready, Abandoned };

    static constexpr size_t kMessageCapacity = 256;

    SharedResultBuffer(size_t slotCount, size_t payloadCapacity);

    SharedResultBuffer(const SharedResultBuffer&) = delete;
    SharedResultBuffer& operator=(const SharedResultBuffer&) = delete;

    /**
     * @brief Reserves a free slot for a request
     * @return Slot index, or nullopt if no slot became free before the deadline
     */
    std::optional<uint32_t> claim(uint64_t requestId, std::chrono::steady_clock::time_point deadline);

    // Returns a claimed slot that was never sent to the proxy
    void cancel(uint32_t slot, uint64_t requestId);

    /**
     * @brief Blocks until the proxy publishes the result for requestId
     *
     * On timeout the slot becomes Abandoned and the result is an IOTimeout failure.
     */
    CommandResult wait(uint32_t slot, uint64_t requestId, std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Writes a result and wakes the requester
     *
     * Payloads longer than payloadCapacity() are truncated; messages longer than
     * kMessageCapacity - 1 are cut.
     * @return false if the requester had abandoned the slot; the result is discarded and the
     *         slot freed
     */
    bool publish(uint32_t slot, uint64_t requestId, const CommandResult& result);

    bool isAbandoned(uint32_t slot, uint64_t requestId) const;

    // Frees an abandoned slot without publishing
    bool discard(uint32_t slot, uint64_t requestId);

    size_t slotCount() const noexcept { return _slots.size(); }
    size_t payloadCapacity() const noexcept { return _payloadCapacity; }
    size_t freeCount() const;

private:
    struct Slot {
        mutable std::mutex mutex;
        std::condition_variable cv;
        SlotState state = SlotState::Free;
        uint64_t requestId = 0;
        IO::StorageError code = IO::StorageError::None;
        int64_t value = 0;
        uint32_t payloadSize = 0;
        std::unique_ptr<std::byte[]> payload;
        char message[kMessageCapacity] = {};
    };

    void freeSlot(uint32_t index);

    std::vector<std::unique_ptr<Slot>> _slots;
    size_t _payloadCapacity;

    mutable std::mutex _freeMutex;
    std::condition_variable _freeCv;
    std::vector<uint32_t> _freeList;
};

} // namespace OriginVault::Core::Concurrency
