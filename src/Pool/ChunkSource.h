/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file ChunkSource.h
 * @brief Pull-based byte producer for streaming imports
 *
 * An importer calls next() until it returns a chunk with endOfData set. The final chunk may
 * still carry bytes. Termination is always explicit; a producer never signals the end by
 * throwing.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace OriginVault::Core::Pool {

struct Chunk {
    std::vector<std::byte> bytes;
    bool endOfData = false;

    static Chunk end() { return Chunk{{}, true}; }
};

class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual Chunk next() = 0;

    // Total length when known upfront; importers verify the written count against it
    virtual std::optional<size_t> totalSize() const { return std::nullopt; }
};

/**
 * @brief Serves an in-memory buffer in fixed-size blocks
 *
 * rewind() restarts the sequence, so the same source can feed several imports.
 */
class VectorChunkSource : public ChunkSource {
public:
    explicit VectorChunkSource(std::vector<std::byte> data, size_t blockSize = 4096)
        : _data(std::move(data))
        , _blockSize(blockSize == 0 ? 1 : blockSize) {}

    Chunk next() override {
        if (_pos >= _data.size()) return Chunk::end();
        const size_t n = std::min(_blockSize, _data.size() - _pos);
        Chunk chunk;
        chunk.bytes.assign(_data.begin() + _pos, _data.begin() + _pos + n);
        _pos += n;
        return chunk;
    }

    std::optional<size_t> totalSize() const override { return _data.size(); }

    void rewind() noexcept { _pos = 0; }

private:
    std::vector<std::byte> _data;
    size_t _blockSize;
    size_t _pos = 0;
};

/**
 * @brief Adapts a callable returning the next chunk
 */
class CallbackChunkSource : public ChunkSource {
public:
    explicit CallbackChunkSource(std::function<Chunk()> fn)
        : _fn(std::move(fn)) {}

    Chunk next() override { return _fn ? _fn() : Chunk::end(); }

private:
    std::function<Chunk()> _fn;
};

} // namespace OriginVault::Core::Pool
