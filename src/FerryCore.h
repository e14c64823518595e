/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

/**
 * @file FerryCore.h
 * @brief Single header that includes all FerryCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/Logger.h"
#include "Logging/ConsoleSink.h"

// Concurrency
#include "Concurrency/CancellationToken.h"
#include "Concurrency/CompletionChannel.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"

// Storage
#include "Storage/StorageTypes.h"
#include "Storage/StoragePath.h"
#include "Storage/ByteStream.h"
#include "Storage/IStorageProvider.h"
#include "Storage/LocalFileSystemProvider.h"
#include "Storage/IObjectStoreClient.h"
#include "Storage/MemoryObjectStoreClient.h"
#include "Storage/LocalBucketClient.h"
#include "Storage/S3ObjectStoreClient.h"
#include "Storage/ObjectStoreProvider.h"
#include "Storage/ProviderFactory.h"
#include "Storage/ProviderRegistry.h"

// Transfer
#include "Transfer/TransferTypes.h"
#include "Transfer/TransferPlanner.h"
#include "Transfer/TransferExecutor.h"

// Panes
#include "Panes/Pane.h"
#include "Panes/DualPaneSession.h"
#include "Panes/DirectoryWatcher.h"
