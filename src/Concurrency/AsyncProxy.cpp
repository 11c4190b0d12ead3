/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "AsyncProxy.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "../Storage/StorageCapabilities.h"
#include <algorithm>
#include <future>

namespace OriginVault::Core::Concurrency {

using IO::StorageError;
using IO::StorageException;

std::string_view toString(DescriptorState state) noexcept {
    switch (state) {
        case DescriptorState::Closed:  return "Closed";
        case DescriptorState::Opening: return "Opening";
        case DescriptorState::Idle:    return "Idle";
        case DescriptorState::Busy:    return "Busy";
        case DescriptorState::Closing: return "Closing";
    }
    return "Unknown";
}

AsyncProxy::AsyncProxy(Config config)
    : _config(std::move(config))
    , _directory(_config.root)
    , _results(std::make_unique<SharedResultBuffer>(_config.resultSlots, _config.slotPayloadBytes)) {
    IO::StorageCapabilities::require("AsyncProxy");
}

AsyncProxy::~AsyncProxy() {
    asyncShutdown();

    if (!_descriptors.empty()) {
        ORIGINVAULT_LOG_WARN_CAT("AsyncProxy", std::to_string(_descriptors.size()) +
                                 " descriptor(s) still open at destruction; closing their handles");
    }
    _descriptors.clear();
    for (auto& [path, shared] : _handles) {
        try {
            shared.handle->close();
        } catch (const StorageException& e) {
            ORIGINVAULT_LOG_ERROR_CAT("AsyncProxy", "Failed to close " + path + ": " + e.what());
        }
    }
    _handles.clear();
}

void AsyncProxy::start() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (_running.load(std::memory_order_acquire)) return;

    _testDelay = Core::envMilliseconds("ORIGINVAULT_TEST_PROXY_DELAY_MS");
    if (_testDelay.count() > 0) {
        ORIGINVAULT_LOG_WARN_CAT("AsyncProxy", "Test delay active: " + std::to_string(_testDelay.count()) + "ms per command");
    }
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        _accepting = true;
        _stopRequested = false;
    }

    // Wait until the I/O thread owns the directory so no driving thread can slip in first
    std::promise<void> bound;
    auto boundFuture = bound.get_future();
    _thread = std::thread([this, bound = std::move(bound)]() mutable {
        _directory.affinity().bindToCurrentThread();
        bound.set_value();
        run();
    });
    boundFuture.wait();
    _running.store(true, std::memory_order_release);
    ORIGINVAULT_LOG_DEBUG_CAT("AsyncProxy", "Started on root " + _config.root.string());
}

void AsyncProxy::asyncShutdown() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (!_thread.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        _accepting = false;
        _stopRequested = true;
    }
    _inboxCv.notify_all();
    _thread.join();
    _running.store(false, std::memory_order_release);
    ORIGINVAULT_LOG_DEBUG_CAT("AsyncProxy", "Shut down with " + std::to_string(_descriptors.size()) + " open descriptor(s)");
}

void AsyncProxy::asyncRestart() {
    asyncShutdown();
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        _inbox.clear();
    }
    _lanes.clear();
    _lastLane = -1;
    start();
    ORIGINVAULT_LOG_INFO_CAT("AsyncProxy", "Restarted");
}

bool AsyncProxy::post(std::vector<std::byte> encoded) {
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        if (!_accepting) return false;
        _inbox.push_back(std::move(encoded));
    }
    _inboxCv.notify_one();
    return true;
}

AsyncProxy::Stats AsyncProxy::stats() const {
    std::lock_guard<std::mutex> lock(_statsMutex);
    return _stats;
}

void AsyncProxy::run() {
    while (true) {
        drainInbox();

        CommandMessage msg;
        int32_t laneId = 0;
        if (pickNext(msg, laneId)) {
            dispatch(msg, laneId);
            continue;
        }

        std::unique_lock<std::mutex> lock(_inboxMutex);
        if (_stopRequested && _inbox.empty()) break;
        _inboxCv.wait_for(lock, _config.idleWait, [this] { return !_inbox.empty() || _stopRequested; });
    }
    _directory.affinity().unbind();
}

void AsyncProxy::drainInbox() {
    std::deque<std::vector<std::byte>> pending;
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        pending.swap(_inbox);
    }
    for (auto& encoded : pending) {
        try {
            enqueue(decodeCommand(encoded));
        } catch (const StorageException& e) {
            // Without a decodable header there is no slot to answer on
            ORIGINVAULT_LOG_ERROR_CAT("AsyncProxy", std::string("Dropping malformed command: ") + e.what());
        }
    }
}

void AsyncProxy::enqueue(CommandMessage msg) {
    const int32_t laneId = isDescriptorOp(msg.opcode) ? msg.fd : 0;

    if (isDescriptorOp(msg.opcode)) {
        if (msg.fd <= 0) {
            reply(msg, CommandResult::failure(StorageError::Misuse, "Invalid descriptor " + std::to_string(msg.fd)));
            return;
        }
        auto it = _descriptors.find(msg.fd);
        if (msg.opcode == Opcode::Open) {
            if (it != _descriptors.end()) {
                reply(msg, CommandResult::failure(StorageError::Misuse, "Descriptor " + std::to_string(msg.fd) + " is already open"));
                return;
            }
            _descriptors[msg.fd].state = DescriptorState::Opening;
        } else if (it == _descriptors.end() || it->second.state == DescriptorState::Closing) {
            reply(msg, CommandResult::failure(StorageError::Misuse, "Descriptor " + std::to_string(msg.fd) + " is not open"));
            return;
        }
    }

    Lane& lane = _lanes[laneId];
    // No-reply commands compensate for a timed-out request (the close after an abandoned open);
    // rejecting one would leave nobody to retry it
    if (_config.backpressure == Config::Backpressure::Reject && msg.slot != kNoReplySlot &&
        (lane.executing || !lane.queue.empty())) {
        {
            std::lock_guard<std::mutex> lock(_statsMutex);
            ++_stats.rejected;
        }
        if (msg.opcode == Opcode::Open) _descriptors.erase(msg.fd);
        reply(msg, CommandResult::failure(StorageError::Busy, "Descriptor is busy with another command"));
        return;
    }
    lane.queue.push_back(std::move(msg));
}

bool AsyncProxy::pickNext(CommandMessage& out, int32_t& laneId) {
    if (_lanes.empty()) return false;

    auto it = _lanes.upper_bound(_lastLane);
    for (size_t visited = 0; visited < _lanes.size(); ++visited) {
        if (it == _lanes.end()) it = _lanes.begin();
        if (!it->second.queue.empty()) {
            out = std::move(it->second.queue.front());
            it->second.queue.pop_front();
            it->second.executing = true;
            laneId = it->first;
            _lastLane = it->first;
            return true;
        }
        ++it;
    }
    return false;
}

void AsyncProxy::dispatch(CommandMessage& msg, int32_t laneId) {
    const bool descriptorOp = isDescriptorOp(msg.opcode);

    if (_config.lateResultPolicy == Config::LateResultPolicy::SuppressIfAbandoned &&
        msg.slot != kNoReplySlot && _results->isAbandoned(msg.slot, msg.requestId)) {
        _results->discard(msg.slot, msg.requestId);
        {
            std::lock_guard<std::mutex> lock(_statsMutex);
            ++_stats.suppressed;
        }
        ORIGINVAULT_LOG_DEBUG_CAT("AsyncProxy", "Suppressed abandoned " + std::string(toString(msg.opcode)) +
                                  " request " + std::to_string(msg.requestId));
        if (msg.opcode == Opcode::Open) _descriptors.erase(msg.fd);
        finishLane(laneId);
        return;
    }

    if (descriptorOp) {
        auto it = _descriptors.find(msg.fd);
        if (it != _descriptors.end()) {
            if (msg.opcode == Opcode::Close) {
                it->second.state = DescriptorState::Closing;
            } else if (msg.opcode != Opcode::Open) {
                it->second.state = DescriptorState::Busy;
            }
        }
    }

    if (_testDelay.count() > 0) {
        std::this_thread::sleep_for(_testDelay);
    }

    ORIGINVAULT_LOG_TRACE_CAT("AsyncProxy", std::string(toString(msg.opcode)) + " fd=" + std::to_string(msg.fd) +
                              " req=" + std::to_string(msg.requestId));
    CommandResult result = execute(msg);
    {
        std::lock_guard<std::mutex> lock(_statsMutex);
        ++_stats.executed;
    }

    // Commands that arrived while this one ran still see the descriptor as Busy
    drainInbox();

    if (descriptorOp) {
        auto it = _descriptors.find(msg.fd);
        if (it != _descriptors.end()) {
            if (msg.opcode == Opcode::Close || (msg.opcode == Opcode::Open && !result.ok())) {
                _descriptors.erase(it);
            } else {
                it->second.state = DescriptorState::Idle;
            }
        }
    }

    reply(msg, result);
    finishLane(laneId);
}

void AsyncProxy::finishLane(int32_t laneId) {
    auto it = _lanes.find(laneId);
    if (it == _lanes.end()) return;
    it->second.executing = false;
    if (laneId != 0 && it->second.queue.empty() && _descriptors.find(laneId) == _descriptors.end()) {
        _lanes.erase(it);
    }
}

void AsyncProxy::reply(const CommandMessage& msg, const CommandResult& result) {
    if (!result.ok()) {
        ORIGINVAULT_LOG_DEBUG_CAT("AsyncProxy", std::string(toString(msg.opcode)) + " failed: " +
                                  std::string(IO::toString(result.code())) + " " + result.error.message);
    }
    if (msg.slot == kNoReplySlot) return;
    if (!_results->publish(msg.slot, msg.requestId, result)) {
        std::lock_guard<std::mutex> lock(_statsMutex);
        ++_stats.lateResults;
    }
}

CommandResult AsyncProxy::execute(CommandMessage& msg) {
    CommandResult result;
    try {
        switch (msg.opcode) {
            case Opcode::Open:
                return doOpen(msg);
            case Opcode::Close:
                return doClose(msg);
            case Opcode::Read: {
                auto& handle = requireHandle(msg, false);
                const size_t want = static_cast<size_t>(std::min<uint64_t>(msg.length, _results->payloadCapacity()));
                result.payload.resize(want);
                const size_t got = handle.read(result.payload, msg.offset);
                result.payload.resize(got);
                result.value = static_cast<int64_t>(got);
                break;
            }
            case Opcode::Write: {
                auto& handle = requireHandle(msg, true);
                result.value = static_cast<int64_t>(handle.write(msg.payload, msg.offset));
                break;
            }
            case Opcode::Truncate:
                requireHandle(msg, true).truncate(msg.offset);
                break;
            case Opcode::Sync:
                requireHandle(msg, false).flush();
                break;
            case Opcode::FileSize:
                result.value = static_cast<int64_t>(requireHandle(msg, false).size());
                break;
            case Opcode::Delete:
                if (_handles.count(IO::OriginDirectory::normalizePath(msg.path))) {
                    throw StorageException(StorageError::Busy, "Cannot delete a file that is open", msg.path);
                }
                result.value = _directory.unlink(msg.path, false) ? 1 : 0;
                break;
            case Opcode::Exists:
                result.value = _directory.entryExists(msg.path) ? 1 : 0;
                break;
            case Opcode::Mkdir:
                result.value = _directory.mkdir(msg.path) ? 1 : 0;
                break;
            case Opcode::Unlink:
                result.value = _directory.unlink(msg.path, (msg.flags & UnlinkFlags::Recursive) != 0) ? 1 : 0;
                break;
            case Opcode::List:
                return doList(msg);
        }
    } catch (const StorageException& e) {
        return CommandResult::failure(e.code(), e.info().message, e.info().path);
    } catch (const std::filesystem::filesystem_error& e) {
        return CommandResult::failure(IO::mapErrnoToStorageError(e.code().value()), e.what(), e.path1().string());
    } catch (const std::exception& e) {
        return CommandResult::failure(StorageError::IOError, e.what(), msg.path);
    }
    return result;
}

AsyncProxy::Descriptor& AsyncProxy::requireDescriptor(const CommandMessage& msg) {
    auto it = _descriptors.find(msg.fd);
    if (it == _descriptors.end()) {
        throw StorageException(StorageError::Misuse, "Descriptor " + std::to_string(msg.fd) + " is not open");
    }
    return it->second;
}

IO::SyncAccessHandle& AsyncProxy::requireHandle(const CommandMessage& msg, bool forWrite) {
    Descriptor& desc = requireDescriptor(msg);
    if (!desc.shared || !desc.shared->handle) {
        throw StorageException(StorageError::Misuse, "Descriptor has no access handle", desc.path);
    }
    if (forWrite && desc.readOnly) {
        throw StorageException(StorageError::ReadOnly, "Descriptor was opened read-only", desc.path);
    }
    return *desc.shared->handle;
}

CommandResult AsyncProxy::doOpen(const CommandMessage& msg) {
    const std::string path = IO::OriginDirectory::normalizePath(msg.path);
    Descriptor& desc = requireDescriptor(msg);

    if (msg.flags & OpenFlags::DeleteBeforeOpen) {
        if (_handles.count(path)) {
            throw StorageException(StorageError::Busy, "Cannot delete a file that is open", path);
        }
        _directory.unlink(path, false);
    }

    auto it = _handles.find(path);
    if (it == _handles.end()) {
        IO::OpenOptions options;
        options.create = (msg.flags & OpenFlags::Create) != 0;
        auto handle = _directory.open(path, options);
        it = _handles.emplace(path, SharedHandle{std::move(handle), 0}).first;
    }
    const uint64_t size = it->second.handle->size();
    ++it->second.refs;

    desc.path = path;
    desc.readOnly = (msg.flags & OpenFlags::ReadOnly) != 0;
    desc.deleteOnClose = (msg.flags & OpenFlags::DeleteOnClose) != 0;
    desc.shared = &it->second;

    CommandResult result;
    result.value = static_cast<int64_t>(size);
    return result;
}

CommandResult AsyncProxy::doClose(const CommandMessage& msg) {
    Descriptor& desc = requireDescriptor(msg);
    releaseShared(desc);
    return CommandResult{};
}

void AsyncProxy::releaseShared(Descriptor& desc) {
    if (!desc.shared) return;
    SharedHandle* shared = desc.shared;
    desc.shared = nullptr;
    if (--shared->refs > 0) return;

    auto handle = std::move(shared->handle);
    _handles.erase(desc.path);
    handle->close();
    if (desc.deleteOnClose) {
        _directory.unlink(desc.path, false);
    }
}

CommandResult AsyncProxy::doList(const CommandMessage& msg) {
    const std::string parent = IO::OriginDirectory::normalizePath(msg.path);
    auto entries = _directory.listEntries(parent);

    CommandResult result;
    size_t index = static_cast<size_t>(msg.offset);
    while (index < entries.size()) {
        if (!appendDirectoryEntry(result.payload, entries[index], _results->payloadCapacity())) break;
        ++index;
    }
    if (index == static_cast<size_t>(msg.offset) && index < entries.size()) {
        throw StorageException(StorageError::IOError, "Directory entry does not fit in a result slot", entries[index].path);
    }
    result.value = index < entries.size() ? static_cast<int64_t>(index) : -1;
    return result;
}

} // namespace OriginVault::Core::Concurrency
