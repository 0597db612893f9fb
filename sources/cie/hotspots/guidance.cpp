//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/hotspots/guidance.hpp"

namespace cie::hotspots {

    namespace {
        const HotspotGuidance kSystemCall{
            "System call detected - high overhead operation",
            "System calls transfer control to the kernel and are expensive operations",
            Severity::Critical,
            "algorithm_improvement",
            "System call detected - batch operations or caching recommended",
            "high",
            "50-80% performance improvement",
            "// Consider batching system calls\n// or caching results",
            "System calls are expensive - understanding their cost helps design efficient kernel interfaces",
            {"system interface design", "cost analysis", "kernel optimization"}
        };

        const HotspotGuidance kMemoryAllocation{
            "Dynamic memory allocation - potential performance bottleneck",
            "Dynamic memory allocation can cause fragmentation and performance degradation",
            Severity::High,
            "memory_optimization",
            "Allocation detected - reuse buffers or allocate once outside hot paths",
            "low",
            "10-25% memory usage reduction",
            "// Instead of: collection.collect()\n// Consider: iterator.chain(other_iterator)",
            "Memory allocations are expensive operations - minimizing them improves performance",
            {"memory management", "lazy evaluation", "iterator patterns"}
        };

        const HotspotGuidance kLoop{
            "Loop detected - potential for vectorization or optimization",
            "Loops can be optimized through vectorization, loop unrolling, or parallelization",
            Severity::Medium,
            "loop_optimization",
            "Loop detected - consider vectorization or parallelization",
            "medium",
            "20-40% performance improvement",
            "// Consider using iterators or parallel iterators\n// for better performance",
            "Loops are often performance bottlenecks - understanding their optimization is crucial for systems programming",
            {"vectorization", "parallelism", "SIMD"}
        };

        const HotspotGuidance kSynchronization{
            "Synchronization primitive - potential contention point",
            "Synchronization primitives can create contention and bottleneck critical paths",
            Severity::High,
            "concurrency_improvement",
            "Shorten critical sections or move the lock out of the loop",
            "medium",
            "Reduced lock contention under load",
            "// Take the lock once around the batch\n// instead of once per item",
            "Every contended lock serializes threads - keeping critical sections short preserves parallelism",
            {"lock contention", "critical sections", "lock-free data structures"}
        };

        const HotspotGuidance kIoBound{
            "I/O operation detected - execution waits on a device or stream",
            "I/O operations block on devices far slower than the CPU",
            Severity::Medium,
            "io_optimization",
            "Buffer or batch I/O operations instead of issuing them one at a time",
            "medium",
            "Fewer device round trips",
            "// Accumulate output in a buffer\n// and flush it once",
            "Device and port access costs orders of magnitude more than memory access - batching amortizes it",
            {"buffering", "port I/O", "asynchronous I/O"}
        };

        const HotspotGuidance kCpuIntensive{
            "CPU-intensive operation detected",
            "Complex computations may benefit from algorithmic optimization or parallelization",
            Severity::Medium,
            "algorithm_improvement",
            "Simplify the computation or split the function into smaller units",
            "high",
            "Lower per-call cost and easier reasoning",
            "// Precompute or memoize results\n// that do not change between calls",
            "Algorithmic complexity dominates constant-factor tuning - pick the right algorithm first",
            {"algorithmic complexity", "memoization", "cyclomatic complexity"}
        };

        const HotspotGuidance kCacheMiss{
            "Potential cache inefficiency detected",
            "Cache misses can significantly impact performance - consider data locality",
            Severity::High,
            "data_layout",
            "Improve data locality - store traversed data contiguously",
            "high",
            "Fewer cache misses on traversal",
            "// Replace linked traversal with\n// an array of structures",
            "Pointer chasing defeats the hardware prefetcher - contiguous layouts keep caches warm",
            {"data locality", "cache lines", "prefetching"}
        };
    }

    const HotspotGuidance& guidance_for(const HotspotType type) {
        switch (type) {
            case HotspotType::SystemCall:       return kSystemCall;
            case HotspotType::MemoryAllocation: return kMemoryAllocation;
            case HotspotType::Loop:             return kLoop;
            case HotspotType::Synchronization:  return kSynchronization;
            case HotspotType::IoBound:          return kIoBound;
            case HotspotType::CpuIntensive:     return kCpuIntensive;
            case HotspotType::CacheMiss:        return kCacheMiss;
        }
        return kLoop;
    }

}  // namespace cie::hotspots
