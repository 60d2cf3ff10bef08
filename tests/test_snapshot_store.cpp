/// @file test_snapshot_store.cpp
/// @brief Unit tests for neoplan::pipeline::SnapshotStore.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "pipeline/snapshot_store.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace neoplan;
using namespace neoplan::pipeline;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    neoplan::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    neoplan::core::Logger::shutdown();
    return result;
}

static SnapshotPtr make_snapshot(u64 version, std::size_t target_count)
{
    auto targets = std::make_shared<TargetList>(target_count);
    for (std::size_t i = 0; i < target_count; ++i)
    {
        (*targets)[i].designation = "T" + std::to_string(i);
    }

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->version = version;
    snapshot->published_at = Clock::now();
    snapshot->targets = std::move(targets);
    return snapshot;
}

TEST_CASE("Store is empty before the first publication")
{
    const SnapshotStore store;
    CHECK(store.current() == nullptr);
    CHECK(store.publish_count() == 0);
}

TEST_CASE("Publish replaces the current snapshot")
{
    SnapshotStore store;
    store.publish(make_snapshot(1, 3));
    REQUIRE(store.current() != nullptr);
    CHECK(store.current()->version == 1);
    CHECK(store.current()->size() == 3);

    store.publish(make_snapshot(2, 5));
    CHECK(store.current()->version == 2);
    CHECK(store.publish_count() == 2);
}

TEST_CASE("A held snapshot outlives its replacement")
{
    SnapshotStore store;
    store.publish(make_snapshot(1, 2));

    const SnapshotPtr held = store.current();
    store.publish(make_snapshot(2, 7));

    CHECK(held->version == 1);
    CHECK(held->size() == 2);
    CHECK((*held->targets)[1].designation == "T1");
    CHECK(store.current()->version == 2);
}

TEST_CASE("Null snapshots are refused")
{
    SnapshotStore store;
    store.publish(make_snapshot(1, 1));
    store.publish(nullptr);
    REQUIRE(store.current() != nullptr);
    CHECK(store.current()->version == 1);
    CHECK(store.publish_count() == 1);
}

TEST_CASE("Snapshot::source reports unknown providers as absent")
{
    Snapshot snapshot;
    snapshot.sources[target::ProviderId::Neocp] = SourceStatus{.last_record_count = 4};
    REQUIRE(snapshot.source(target::ProviderId::Neocp).has_value());
    CHECK(snapshot.source(target::ProviderId::Neocp)->last_record_count == 4);
    CHECK_FALSE(snapshot.source(target::ProviderId::Fink).has_value());
}

TEST_CASE("Readers see whole generations while a writer publishes")
{
    SnapshotStore store;
    store.publish(make_snapshot(1, 1));

    std::atomic<bool> done{false};
    std::atomic<u32>  torn{0};
    std::atomic<u32>  regressions{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r)
    {
        readers.emplace_back([&] {
            u64 last_version = 0;
            while (!done.load())
            {
                const SnapshotPtr s = store.current();
                // Generation v carries exactly v targets
                if (s->size() != s->version)
                {
                    ++torn;
                }
                if (s->version < last_version)
                {
                    ++regressions;
                }
                last_version = s->version;
            }
        });
    }

    for (u64 v = 2; v <= 200; ++v)
    {
        store.publish(make_snapshot(v, static_cast<std::size_t>(v)));
    }
    done.store(true);
    for (auto& t : readers)
    {
        t.join();
    }

    CHECK(torn.load() == 0);
    CHECK(regressions.load() == 0);
    CHECK(store.current()->version == 200);
}
