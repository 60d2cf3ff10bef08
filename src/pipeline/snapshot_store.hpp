#pragma once

/// @file snapshot_store.hpp
/// @brief Holder of the current Snapshot with atomic publication.

#include "pipeline/snapshot.hpp"

#include <atomic>

namespace neoplan::pipeline
{
    /// @brief Single-writer, many-reader slot for the current Snapshot.
    ///
    /// Readers get a shared_ptr that stays valid for as long as they hold it,
    /// even after newer Snapshots are published. The old generation is freed
    /// when its last reader lets go. Owned explicitly and passed around; there
    /// is no global instance.
    class SnapshotStore
    {
    public:
        SnapshotStore() = default;

        SnapshotStore(const SnapshotStore&) = delete;
        SnapshotStore& operator=(const SnapshotStore&) = delete;

        /// @brief Current Snapshot, or nullptr before the first publication.
        [[nodiscard]] SnapshotPtr current() const;

        /// @brief Atomically replace the current Snapshot.
        void publish(SnapshotPtr snapshot);

        /// @brief Number of publish() calls.
        [[nodiscard]] u64 publish_count() const { return m_publish_count.load(); }

    private:
        std::atomic<SnapshotPtr> m_current;
        std::atomic<u64>         m_publish_count{0};
    };

} // namespace neoplan::pipeline
