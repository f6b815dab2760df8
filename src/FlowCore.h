/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

/**
 * @file FlowCore.h
 * @brief Single header that includes all FlowCore components
 */

// Core common utilities
#include "CoreCommon.h"
#include "Core/Value.h"
#include "Core/ValueJson.h"
#include "Core/WorkflowErrors.h"
#include "Core/EventBus.h"

// Debug
#include "Debug/Profiling.h"

// Logging
#include "Logging/LogLevel.h"
#include "Logging/LogEntry.h"
#include "Logging/ILogSink.h"
#include "Logging/ConsoleSink.h"
#include "Logging/Logger.h"

// Store
#include "Store/IReactiveStore.h"
#include "Store/MemoryStore.h"
#include "Store/ISnapshotCodec.h"
#include "Store/JsonSnapshotCodec.h"

// Bridge
#include "Bridge/SharedChannel.h"
#include "Bridge/BridgeMessages.h"
#include "Bridge/IRemoteTransport.h"
#include "Bridge/RemoteWorker.h"
#include "Bridge/PendingCall.h"
#include "Bridge/ChannelClient.h"
#include "Bridge/CallStrategy.h"
#include "Bridge/CrossDomainBridge.h"

// Flow
#include "Flow/WorkflowTypes.h"
#include "Flow/WorkflowEvents.h"
#include "Flow/StepLog.h"
#include "Flow/StepRegistry.h"
#include "Flow/TimerService.h"
#include "Flow/StepContext.h"
#include "Flow/WorkflowScheduler.h"
#include "Flow/StepExecutor.h"
#include "Flow/Workflow.h"
#include "Flow/EngineConfig.h"
#include "Flow/WorkflowEngine.h"
