/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file AsyncProxy.h
 * @brief Message-driven I/O context that owns the origin storage root
 *
 * The AsyncProxy runs one dedicated I/O thread. That thread is the only context allowed to
 * touch the OriginDirectory (its affinity is bound to the thread on start), so every file
 * operation from a driving thread travels as a serialized CommandMessage and comes back
 * through the SharedResultBuffer.
 *
 * Each descriptor moves through Closed -> Opening -> Idle <-> Busy -> Closing -> Closed.
 * Commands for one descriptor run in submission order; different descriptors are served
 * round robin and may interleave. Path commands (delete, exists, mkdir, unlink, list) share
 * a separate lane.
 *
 * @code
 * AsyncProxy::Config cfg;
 * cfg.root = "/var/lib/app/origin";
 * AsyncProxy proxy(cfg);
 * proxy.start();
 *
 * ProxyClient client(proxy);
 * int32_t fd = proxy.nextDescriptor();
 * client.open(fd, "/db.sqlite3", OpenFlags::Create);
 * client.write(fd, bytes, 0);
 * client.close(fd);
 *
 * proxy.asyncShutdown();   // drains queued commands, then stops
 * @endcode
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "CommandMessage.h"
#include "SharedResultBuffer.h"
#include "../Storage/OriginDirectory.h"

namespace OriginVault::Core::Concurrency {

enum class DescriptorState : uint8_t { Closed, Opening, Idle, Busy, Closing };

std::string_view toString(DescriptorState state) noexcept;

class AsyncProxy {
public:
    struct Config {
        std::filesystem::path root;

        // Result cells shared with requesters
        size_t resultSlots;
        // Bytes one result can carry; reads larger than this are split by ProxyClient
        size_t slotPayloadBytes;

        // What happens to a command for a descriptor that is already executing one
        enum class Backpressure { Queue, Reject } backpressure;
        // What happens to a command whose requester timed out before it ran
        enum class LateResultPolicy { ApplyLate, SuppressIfAbandoned } lateResultPolicy;

        // Requester-side wait used when the client does not pass its own
        std::chrono::milliseconds defaultTimeout;
        // Upper bound on how long the I/O thread sleeps with nothing to do
        std::chrono::milliseconds idleWait;

        Config()
            : root(std::filesystem::temp_directory_path() / "originvault")
            , resultSlots(8)
            , slotPayloadBytes(65536 + 512)
            , backpressure(Backpressure::Queue)
            , lateResultPolicy(LateResultPolicy::ApplyLate)
            , defaultTimeout(std::chrono::seconds(30))
            , idleWait(std::chrono::milliseconds(100)) {}
    };

    struct Stats {
        uint64_t executed = 0;
        uint64_t rejected = 0;
        uint64_t suppressed = 0;
        uint64_t lateResults = 0;
    };

    /**
     * @throws StorageException CantOpen when storage is unavailable or the root cannot be created
     */
    explicit AsyncProxy(Config config = Config{});
    ~AsyncProxy();

    AsyncProxy(const AsyncProxy&) = delete;
    AsyncProxy& operator=(const AsyncProxy&) = delete;

    // Starts the I/O thread; no-op if already running
    void start();

    /**
     * @brief Stops accepting commands, executes everything already submitted, joins the thread
     *
     * Open descriptors and their handles survive; asyncRestart() resumes service for them.
     */
    void asyncShutdown();

    // Shuts down if needed, resets the command channel and starts a fresh I/O thread
    void asyncRestart();

    bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

    /**
     * @brief Queues an encoded command for the I/O thread
     * @return false when the proxy is not accepting commands
     */
    bool post(std::vector<std::byte> encoded);

    uint64_t nextRequestId() noexcept { return _nextRequestId.fetch_add(1, std::memory_order_relaxed); }
    int32_t nextDescriptor() noexcept { return _nextDescriptor.fetch_add(1, std::memory_order_relaxed); }

    SharedResultBuffer& results() noexcept { return *_results; }
    const Config& config() const noexcept { return _config; }

    // The storage root; only usable from the I/O thread once started
    IO::OriginDirectory& directory() noexcept { return _directory; }

    Stats stats() const;

private:
    struct SharedHandle {
        std::unique_ptr<IO::SyncAccessHandle> handle;
        size_t refs = 0;
    };

    struct Descriptor {
        DescriptorState state = DescriptorState::Closed;
        std::string path;
        bool readOnly = false;
        bool deleteOnClose = false;
        SharedHandle* shared = nullptr;
    };

    // Per-descriptor FIFO; lane 0 carries path commands
    struct Lane {
        std::deque<CommandMessage> queue;
        bool executing = false;
    };

    void run();
    void drainInbox();
    void enqueue(CommandMessage msg);
    bool pickNext(CommandMessage& out, int32_t& laneId);
    void dispatch(CommandMessage& msg, int32_t laneId);
    CommandResult execute(CommandMessage& msg);
    void reply(const CommandMessage& msg, const CommandResult& result);
    void finishLane(int32_t laneId);

    CommandResult doOpen(const CommandMessage& msg);
    CommandResult doClose(const CommandMessage& msg);
    CommandResult doList(const CommandMessage& msg);
    Descriptor& requireDescriptor(const CommandMessage& msg);
    IO::SyncAccessHandle& requireHandle(const CommandMessage& msg, bool forWrite);
    void releaseShared(Descriptor& desc);

    Config _config;
    IO::OriginDirectory _directory;
    std::unique_ptr<SharedResultBuffer> _results;

    std::atomic<uint64_t> _nextRequestId{1};
    std::atomic<int32_t> _nextDescriptor{1};

    // Channel shared with requesters
    mutable std::mutex _inboxMutex;
    std::condition_variable _inboxCv;
    std::deque<std::vector<std::byte>> _inbox;
    bool _accepting = false;
    bool _stopRequested = false;

    std::atomic<bool> _running{false};
    std::thread _thread;
    std::mutex _lifecycleMutex;

    // Owned by the I/O thread
    std::map<int32_t, Lane> _lanes;
    int32_t _lastLane = -1;
    std::unordered_map<int32_t, Descriptor> _descriptors;
    std::unordered_map<std::string, SharedHandle> _handles;
    std::chrono::milliseconds _testDelay{0};

    mutable std::mutex _statsMutex;
    Stats _stats;
};

} // namespace OriginVault::Core::Concurrency
