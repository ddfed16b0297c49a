#ifndef JCX_MYLIST_CORE_METRICS_H
#define JCX_MYLIST_CORE_METRICS_H

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

// Counting compiles away unless MYLIST_ENABLE_METRICS is set; the snapshot
// then reads all zeros.
#if MYLIST_ENABLE_METRICS
#define MYLIST_METRICS_INC(counter) (counter).add()
#else
#define MYLIST_METRICS_INC(counter) ((void)0)
#endif

namespace jcailloux::mylist {

// ShardedCounter - relaxed counter split over cache lines. Each thread is
// given a shard the first time it counts, so loops on different threads
// sharing one service do not bounce a single line.
template<size_t Shards = 8>
class ShardedCounter {
    static_assert((Shards & (Shards - 1)) == 0, "Shards must be a power of two");

public:
    void add(uint64_t n = 1) noexcept {
        shards_[shardOfThisThread()].n.fetch_add(n, std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t total() const noexcept {
        uint64_t sum = 0;
        for (const auto& s : shards_) sum += s.n.load(std::memory_order_relaxed);
        return sum;
    }

private:
    struct alignas(64) Shard {
        std::atomic<uint64_t> n{0};
    };

    static size_t shardOfThisThread() noexcept {
        static std::atomic<size_t> nextShard{0};
        thread_local const size_t mine =
            nextShard.fetch_add(1, std::memory_order_relaxed) & (Shards - 1);
        return mine;
    }

    std::array<Shard, Shards> shards_{};
};

/// Point-in-time copy of ServiceCounters.
struct MetricsSnapshot {
    uint64_t page_hits = 0;
    uint64_t page_misses = 0;
    uint64_t rebuilds = 0;
    uint64_t lock_busy = 0;
    uint64_t poll_hits = 0;
    uint64_t direct_reads = 0;
    uint64_t degraded_reads = 0;
    uint64_t fast_path_patches = 0;

    /// Cached page reads over all page lookups; 0 before the first read.
    [[nodiscard]] double hitRatio() const noexcept {
        const uint64_t lookups = page_hits + page_misses;
        if (lookups == 0) return 0.0;
        return static_cast<double>(page_hits) / static_cast<double>(lookups);
    }
};

/// Read and write path counters of one MyListService.
struct ServiceCounters {
    ShardedCounter<> page_hits;
    ShardedCounter<> page_misses;
    ShardedCounter<> rebuilds;          // pages built by the lock holder
    ShardedCounter<> lock_busy;
    ShardedCounter<> poll_hits;         // busy readers served by another's rebuild
    ShardedCounter<> direct_reads;      // busy readers that gave up waiting
    ShardedCounter<> degraded_reads;    // cache backend down, served from the store
    ShardedCounter<> fast_path_patches;

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot s;
        s.page_hits = page_hits.total();
        s.page_misses = page_misses.total();
        s.rebuilds = rebuilds.total();
        s.lock_busy = lock_busy.total();
        s.poll_hits = poll_hits.total();
        s.direct_reads = direct_reads.total();
        s.degraded_reads = degraded_reads.total();
        s.fast_path_patches = fast_path_patches.total();
        return s;
    }
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_METRICS_H
