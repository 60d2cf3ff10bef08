/// @file snapshot_store.cpp
/// @brief SnapshotStore implementation.

#include "pipeline/snapshot_store.hpp"

#include "core/logger.hpp"

#include <utility>

namespace neoplan::pipeline
{

SnapshotPtr SnapshotStore::current() const
{
    return m_current.load(std::memory_order_acquire);
}

void SnapshotStore::publish(SnapshotPtr snapshot)
{
    if (!snapshot)
    {
        NPL_CORE_ERROR("SnapshotStore: refusing to publish a null snapshot");
        return;
    }

    NPL_CORE_DEBUG("SnapshotStore: publishing v{} ({} targets{})",
                   snapshot->version, snapshot->size(), snapshot->stale ? ", stale" : "");

    m_current.store(std::move(snapshot), std::memory_order_release);
    ++m_publish_count;
}

} // namespace neoplan::pipeline
