/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file ByteOrder.h
 * @brief Little-endian load/store helpers for persisted and serialized integers
 *
 * Slot headers and command messages are always little-endian regardless of host order.
 */
#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace OriginVault::Core::ByteOrder {

template<typename T>
concept Word = std::is_integral_v<T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

template<Word T>
inline void storeLE(std::byte* dst, T value) noexcept {
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    if constexpr (std::endian::native == std::endian::little) {
        std::memcpy(dst, &v, sizeof(U));
    } else {
        for (size_t i = 0; i < sizeof(U); ++i) {
            dst[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
        }
    }
}

template<Word T>
inline T loadLE(const std::byte* src) noexcept {
    using U = std::make_unsigned_t<T>;
    U v = 0;
    if constexpr (std::endian::native == std::endian::little) {
        std::memcpy(&v, src, sizeof(U));
    } else {
        for (size_t i = 0; i < sizeof(U); ++i) {
            v |= static_cast<U>(static_cast<U>(src[i]) << (8 * i));
        }
    }
    return static_cast<T>(v);
}

} // namespace OriginVault::Core::ByteOrder
