/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once

/**
 * @file OriginVaultCore.h
 * @brief Single header that includes all OriginVaultCore components
 */

// Core common utilities
#include "CoreCommon.h"
#include "Core/ByteOrder.h"
#include "Core/SlotPool.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Synchronous storage backend
#include "Storage/ContextAffinity.h"
#include "Storage/OriginDirectory.h"
#include "Storage/StorageCapabilities.h"
#include "Storage/StorageError.h"
#include "Storage/SyncAccessHandle.h"

// Async proxy
#include "Concurrency/AsyncProxy.h"
#include "Concurrency/CommandMessage.h"
#include "Concurrency/DirectoryClient.h"
#include "Concurrency/ProxyClient.h"
#include "Concurrency/SharedResultBuffer.h"

// Handle pool
#include "Pool/ChunkSource.h"
#include "Pool/DatabaseImage.h"
#include "Pool/HandlePool.h"
#include "Pool/PoolRegistry.h"

// SQLite VFS adapters
#include "VirtualFileSystem/LockTable.h"
#include "VirtualFileSystem/PoolVfs.h"
#include "VirtualFileSystem/ProxyVfs.h"
#include "VirtualFileSystem/SqliteVfsBase.h"
