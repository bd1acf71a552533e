/// @file cache.cpp
/// @brief State cache implementation

#include <xref_engine/resolve/cache.hpp>
#include <xref_engine/resolve/builder.hpp>
#include <xref_engine/core/log.hpp>

namespace xref_resolve {

StateCache::StateCache(ResolverConfig config)
    : m_builder([config = std::move(config)](const xref_index::DeclarationIndex& index) {
          return build_state(index, config);
      })
{}

StateCache::StateCache(BuildFn builder)
    : m_builder(std::move(builder))
{}

std::shared_ptr<const State> StateCache::get_state(const xref_index::DeclarationIndex& index) {
    auto logger = xref_core::cache_logger();
    std::unique_lock lock(m_mutex);

    for (;;) {
        std::uint64_t version = index.modification_count();
        if (m_state && m_index == &index && m_version == version) {
            ++m_stats.hits;
            return m_state;
        }

        if (m_building) {
            ++m_stats.waits;
            m_build_done.wait(lock, [this] { return !m_building; });
            continue;
        }

        m_building = true;
        std::uint64_t epoch = m_epoch;
        lock.unlock();

        logger->debug("Rebuilding cross-reference state (version {})", version);

        std::shared_ptr<const State> state;
        try {
            state = m_builder(index);
        } catch (...) {
            // Release waiters before propagating; one of them retries the build
            lock.lock();
            m_building = false;
            m_build_done.notify_all();
            logger->error("Cross-reference build failed (version {})", version);
            throw;
        }

        lock.lock();
        m_building = false;
        ++m_stats.rebuilds;
        if (epoch == m_epoch) {
            m_state = state;
            m_index = &index;
            m_version = version;
        } else {
            logger->debug("Cache invalidated during rebuild, result not memoized");
        }
        m_build_done.notify_all();
        return state;
    }
}

std::shared_ptr<const State> StateCache::peek() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void StateCache::invalidate() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.reset();
    m_index = nullptr;
    ++m_epoch;
    xref_core::cache_logger()->debug("Cross-reference state invalidated");
}

StateCacheStats StateCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace xref_resolve
