/// @file test_target_query.cpp
/// @brief Unit tests for the Snapshot queries (rank, lookup, listing, status).

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "pipeline/target_query.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace neoplan;
using namespace neoplan::pipeline;
using observatory::TelescopeProfile;
using target::ProviderId;
using target::Target;

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

// =================================================================
// Fixtures
// =================================================================

static const Instant kNow = astro::TimeSystem::to_instant(astro::DateTime{
    .year = 2026, .month = 2, .day = 15, .hour = 18, .minute = 0, .second = 0.0});

static Target make(const std::string& designation, ProviderId provider, f64 ra, f64 dec,
                   std::optional<f64> mag_v)
{
    Target t;
    t.designation = designation;
    t.source = provider;
    t.contributing_sources = {provider};
    t.ra_deg = ra;
    t.dec_deg = dec;
    t.epoch = kNow;
    t.updated_at = kNow;
    t.mag_v = mag_v;
    return t;
}

static SnapshotPtr make_snapshot(TargetList targets)
{
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->version = 7;
    snapshot->published_at = kNow;
    snapshot->targets = std::make_shared<const TargetList>(std::move(targets));
    snapshot->sources[ProviderId::Scout] = SourceStatus{.last_record_count = 1, .consecutive_failures = 2};
    snapshot->sources[ProviderId::Neocp] = SourceStatus{.last_success_at = kNow, .last_record_count = 3};
    return snapshot;
}

/// Evening sky over Wallace: two observable targets, one too faint, one never up.
static SnapshotPtr evening_snapshot()
{
    Target urgent = make("C4KBW22", ProviderId::Neocp, 5.127, 58.112, 19.1);
    urgent.neo_score = 100.0;
    urgent.arc_days = 0.01;
    urgent.not_seen_days = 0.4;
    urgent.contributing_sources = {ProviderId::Neocp, ProviderId::Scout};
    urgent.aliases = {"2026 CA1"};

    Target routine = make("A11pQzD", ProviderId::Neocp, 121.884, 21.337, 18.2);
    routine.neo_score = 20.0;
    routine.arc_days = 5.0;

    Target faint = make("P21vSd3", ProviderId::Neocp, 64.512, 42.804, 20.3);
    Target southern = make("2026 CZ7", ProviderId::Sentry, 212.774, -74.318, 15.0);

    return make_snapshot({southern, routine, urgent, faint});
}

// =================================================================
// rank
// =================================================================

TEST_CASE("rank keeps observable targets, best first")
{
    const auto ranked = rank(evening_snapshot(), observatory::make_wallace_profile(), {}, 0, kNow);

    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].target.designation == "C4KBW22");
    CHECK(ranked[1].target.designation == "A11pQzD");
    CHECK(ranked[0].rank == 1);
    CHECK(ranked[1].rank == 2);
    CHECK(ranked[0].score > ranked[1].score);

    for (const auto& entry : ranked)
    {
        CHECK(entry.observability.observable);
        CHECK(entry.score >= 0.0);
        CHECK(entry.score <= 100.0);
    }
}

TEST_CASE("rank honours the limit")
{
    const auto ranked = rank(evening_snapshot(), observatory::make_wallace_profile(), {}, 1, kNow);
    REQUIRE(ranked.size() == 1);
    CHECK(ranked[0].target.designation == "C4KBW22");
}

TEST_CASE("rank breaks score ties by designation")
{
    // Identical records under different names score identically
    TargetList targets;
    for (const char* name : {"Z9", "B2", "M5", "A1"})
    {
        targets.push_back(make(name, ProviderId::Neocp, 5.127, 58.112, 17.0));
    }

    const auto ranked = rank(make_snapshot(targets), observatory::make_wallace_profile(), {}, 0, kNow);
    REQUIRE(ranked.size() == 4);
    CHECK(ranked[0].target.designation == "A1");
    CHECK(ranked[1].target.designation == "B2");
    CHECK(ranked[2].target.designation == "M5");
    CHECK(ranked[3].target.designation == "Z9");
}

TEST_CASE("rank over many targets matches the sequential evaluation")
{
    TargetList targets;
    for (int i = 0; i < 200; ++i)
    {
        Target t = make("T" + std::to_string(1000 + i), ProviderId::Fink,
                        std::fmod(i * 7.3, 360.0), -30.0 + (i % 90), 14.0 + (i % 7));
        t.neo_score = static_cast<f64>(i % 101);
        t.arc_days = 0.05 * (1 + i % 13);
        targets.push_back(std::move(t));
    }
    const SnapshotPtr snapshot = make_snapshot(targets);
    const TelescopeProfile wallace = observatory::make_wallace_profile();

    const auto ranked = rank(snapshot, wallace, {}, 0, kNow);

    std::size_t observable = 0;
    for (const auto& t : targets)
    {
        if (observatory::ObservabilityEngine::evaluate(t, wallace, kNow).observable)
        {
            ++observable;
        }
    }
    CHECK(ranked.size() == observable);

    for (std::size_t i = 1; i < ranked.size(); ++i)
    {
        CHECK(scoring::PriorityScorer::ranks_before(ranked[i - 1].score, ranked[i - 1].target.designation,
                                                    ranked[i].score, ranked[i].target.designation));
    }

    // Repeat calls give the same order
    const auto again = rank(snapshot, wallace, {}, 0, kNow);
    REQUIRE(again.size() == ranked.size());
    for (std::size_t i = 0; i < ranked.size(); ++i)
    {
        CHECK(again[i].target.designation == ranked[i].target.designation);
        CHECK(again[i].score == ranked[i].score);
    }
}

TEST_CASE("rank rejects an invalid profile")
{
    TelescopeProfile broken = observatory::make_wallace_profile();
    broken.lat_deg = 123.0;

    CHECK_THROWS_AS(static_cast<void>(rank(evening_snapshot(), broken, {}, 0, kNow)), core::InvalidProfileError);
}

TEST_CASE("rank before any publication is empty")
{
    CHECK(rank(nullptr, observatory::make_wallace_profile(), {}, 0, kNow).empty());
}

// =================================================================
// lookup / list / targets_from
// =================================================================

TEST_CASE("lookup finds by designation or alias, ignoring case")
{
    const SnapshotPtr snapshot = evening_snapshot();

    const auto by_name = lookup(snapshot, "c4kbw22");
    REQUIRE(by_name.has_value());
    CHECK(by_name->designation == "C4KBW22");

    const auto by_alias = lookup(snapshot, "2026 ca1");
    REQUIRE(by_alias.has_value());
    CHECK(by_alias->designation == "C4KBW22");

    CHECK_FALSE(lookup(snapshot, "2099 ZZ9").has_value());
    CHECK_FALSE(lookup(nullptr, "C4KBW22").has_value());
}

TEST_CASE("lookup prefers a designation over another target's alias")
{
    Target a = make("K1", ProviderId::Neocp, 10.0, 10.0, 18.0);
    a.aliases = {"K2"};
    const Target b = make("K2", ProviderId::Scout, 50.0, 10.0, 18.0);

    const auto found = lookup(make_snapshot({a, b}), "K2");
    REQUIRE(found.has_value());
    CHECK(found->source == ProviderId::Scout);
}

TEST_CASE("list_targets returns everything, observable or not")
{
    const SnapshotPtr snapshot = evening_snapshot();
    CHECK(list_targets(snapshot).size() == 4);
    CHECK(list_targets(snapshot, 2).size() == 2);
    CHECK(list_targets(snapshot, 10).size() == 4);
    CHECK(list_targets(nullptr).empty());
}

TEST_CASE("targets_from filters on contributing providers")
{
    const SnapshotPtr snapshot = evening_snapshot();

    const auto scout = targets_from(snapshot, ProviderId::Scout);
    REQUIRE(scout.size() == 1);
    CHECK(scout[0].designation == "C4KBW22");

    CHECK(targets_from(snapshot, ProviderId::Neocp).size() == 3);
    CHECK(targets_from(snapshot, ProviderId::Fink).empty());
}

// =================================================================
// status
// =================================================================

TEST_CASE("status before any publication is not ready")
{
    const HealthStatus health = status(nullptr);
    CHECK_FALSE(health.ready);
    CHECK_FALSE(health.published_at.has_value());
    CHECK(health.providers.empty());
}

TEST_CASE("status mirrors the snapshot")
{
    const HealthStatus health = status(evening_snapshot());
    CHECK(health.ready);
    CHECK(health.version == 7);
    CHECK(health.published_at == kNow);
    CHECK_FALSE(health.stale);
    CHECK(health.target_count == 4);

    REQUIRE(health.providers.size() == 2);
    CHECK(health.providers[0].id == ProviderId::Neocp);
    CHECK(health.providers[0].last_record_count == 3);
    CHECK(health.providers[1].id == ProviderId::Scout);
    CHECK(health.providers[1].consecutive_failures == 2);
    CHECK_FALSE(health.providers[1].last_success_at.has_value());
}
