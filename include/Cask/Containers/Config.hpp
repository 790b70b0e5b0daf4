/// @file Config.hpp
/// @brief Compile-time tuning knobs for Cask::Containers::ConcurrentMap.
#pragma once

// Chain length at which a bin publishes a hash-sorted lookup index.
#ifndef CASK_CONCURRENT_MAP_TREEIFY_THRESHOLD
#define CASK_CONCURRENT_MAP_TREEIFY_THRESHOLD 8
#endif

// Chain length at or below which an indexed bin drops its index again.
#ifndef CASK_CONCURRENT_MAP_UNTREEIFY_THRESHOLD
#define CASK_CONCURRENT_MAP_UNTREEIFY_THRESHOLD 6
#endif

// Below this many bins a crowded bin grows the table instead of being indexed.
#ifndef CASK_CONCURRENT_MAP_MIN_INDEXED_CAPACITY
#define CASK_CONCURRENT_MAP_MIN_INDEXED_CAPACITY 64
#endif

// Bins a writer migrates on behalf of an in-flight resize before returning.
#ifndef CASK_CONCURRENT_MAP_MIGRATION_STRIDE
#define CASK_CONCURRENT_MAP_MIGRATION_STRIDE 4
#endif

// Detect callbacks re-entering their own bucket and throw instead of deadlocking.
#ifndef CASK_CONCURRENT_MAP_REENTRANCY_CHECKS
#define CASK_CONCURRENT_MAP_REENTRANCY_CHECKS 1
#endif

#if CASK_CONCURRENT_MAP_UNTREEIFY_THRESHOLD >= CASK_CONCURRENT_MAP_TREEIFY_THRESHOLD
#error "CASK_CONCURRENT_MAP_UNTREEIFY_THRESHOLD must be below CASK_CONCURRENT_MAP_TREEIFY_THRESHOLD"
#endif
