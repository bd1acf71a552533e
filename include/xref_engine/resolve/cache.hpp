#pragma once

/// @file cache.hpp
/// @brief Memoized cross-reference state with single-flight rebuilds
///
/// The cache holds one State, keyed by the index it was built from and that
/// index's modification count. Counts are never reused across index
/// instances, so a recycled index address cannot match a stale entry.
/// A changed count invalidates the whole state;
/// there is no incremental update. While a rebuild runs, other callers wait
/// for it and share its result instead of starting their own.

#include "fwd.hpp"
#include "config.hpp"
#include "state.hpp"
#include <xref_engine/index/declaration.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace xref_resolve {

/// Cache statistics
struct StateCacheStats {
    std::uint64_t hits = 0;        ///< Calls answered from the memo
    std::uint64_t rebuilds = 0;    ///< Completed builds
    std::uint64_t waits = 0;       ///< Calls that waited on an in-flight build
};

/// Process-wide memo of the cross-reference state
class StateCache {
public:
    using BuildFn = std::function<std::shared_ptr<const State>(const xref_index::DeclarationIndex&)>;

    /// Cache building with build_state() and the given configuration
    explicit StateCache(ResolverConfig config = {});

    /// Cache building with a custom builder
    explicit StateCache(BuildFn builder);

    // Non-copyable
    StateCache(const StateCache&) = delete;
    StateCache& operator=(const StateCache&) = delete;

    /// Current state for the index, rebuilding if its modification count changed
    [[nodiscard]] std::shared_ptr<const State> get_state(const xref_index::DeclarationIndex& index);

    /// Memoized state without building, or null
    [[nodiscard]] std::shared_ptr<const State> peek() const;

    /// Drop the memo. A build in flight still completes but is not memoized.
    void invalidate();

    [[nodiscard]] StateCacheStats stats() const;

private:
    BuildFn m_builder;

    mutable std::mutex m_mutex;
    std::condition_variable m_build_done;
    bool m_building = false;
    std::uint64_t m_epoch = 0;

    std::shared_ptr<const State> m_state;
    const xref_index::DeclarationIndex* m_index = nullptr;
    std::uint64_t m_version = 0;

    StateCacheStats m_stats;
};

} // namespace xref_resolve
