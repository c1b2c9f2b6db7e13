#pragma once

#include "core/CacheContext.hpp"
#include "core/Error.hpp"
#include "config/CacheOptions.hpp"
#include "value/Value.hpp"
#include "encode/CanonicalEncoder.hpp"
#include "theme/Theme.hpp"
#include "theme/ThemeGraphResolver.hpp"
#include "cache/LruCache.hpp"
#include "cache/ResolutionCache.hpp"
#include "cache/ElementCache.hpp"
#include "lifecycle/MountTracker.hpp"
#include "lifecycle/LifecycleBoundary.hpp"
#include "node/Artifact.hpp"
#include "node/StableKey.hpp"
#include "node/NodeConstructor.hpp"
#include "eviction/Scheduler.hpp"
#include "eviction/EnvironmentSignals.hpp"
#include "eviction/HistoryNavigation.hpp"
#include "eviction/ProcMemoryProbe.hpp"
#include "eviction/EvictionPolicies.hpp"
#include "eviction/EvictionController.hpp"
