/// @file test_deduplicator.cpp
/// @brief Unit tests for neoplan::pipeline::Deduplicator.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "pipeline/deduplicator.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#include <vector>

using namespace neoplan;
using namespace neoplan::pipeline;
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

static constexpr f64 kArcsec = 1.0 / 3600.0;

static const Instant kT0 = astro::TimeSystem::to_instant(astro::DateTime{
    .year = 2026, .month = 2, .day = 15, .hour = 18, .minute = 0, .second = 0.0});

static Target make(const std::string& designation, ProviderId provider, f64 ra, f64 dec,
                   Instant epoch = kT0)
{
    Target t;
    t.designation = designation;
    t.source = provider;
    t.contributing_sources = {provider};
    t.ra_deg = ra;
    t.dec_deg = dec;
    t.epoch = epoch;
    t.updated_at = epoch;
    t.raw = {target::RawPayload{.provider = provider, .payload = designation}};
    return t;
}

static const Target* find_by_designation(const DedupResult& result, const std::string& designation)
{
    for (const auto& t : result.targets)
    {
        if (t.designation == designation)
        {
            return &t;
        }
    }
    return nullptr;
}

// =================================================================
// Positional matching
// =================================================================

TEST_CASE("Reports 1 arcsec apart from two feeds become one target")
{
    Target neocp = make("C4KBW22", ProviderId::Neocp, 5.127, 58.112);
    neocp.mag_v = 19.1;
    neocp.neo_score = 100.0;

    Target scout = make("C4KBW22", ProviderId::Scout, 5.127, 58.112 + 0.9 * kArcsec);
    scout.arc_days = 0.01;

    const DedupResult result = Deduplicator().deduplicate({neocp, scout});

    REQUIRE(result.targets.size() == 1);
    CHECK(result.ambiguities == 0);

    const Target& merged = result.targets.front();
    CHECK(merged.designation == "C4KBW22");
    CHECK(merged.source == ProviderId::Neocp);
    CHECK(merged.contributing_sources == std::set<ProviderId>{ProviderId::Neocp, ProviderId::Scout});
    CHECK(merged.mag_v == 19.1);
    CHECK(merged.neo_score == 100.0);
    CHECK(merged.arc_days == 0.01);
    CHECK(merged.aliases.empty());
    CHECK(merged.raw.size() == 2);
}

TEST_CASE("Reports outside the match radius stay separate")
{
    const Target a = make("A11pQzD", ProviderId::Neocp, 150.0, 10.0);
    const Target b = make("ZTF0Ab9", ProviderId::Fink, 150.0, 10.0 + 2.5 * kArcsec);

    const DedupResult result = Deduplicator().deduplicate({a, b});
    CHECK(result.targets.size() == 2);
}

TEST_CASE("Reports at one position but far apart in time stay separate")
{
    const Target a = make("A11pQzD", ProviderId::Neocp, 150.0, 10.0, kT0);
    const Target b = make("ZTF0Ab9", ProviderId::Fink, 150.0, 10.0, kT0 + std::chrono::hours(2));

    CHECK(Deduplicator().deduplicate({a, b}).targets.size() == 2);

    const Deduplicator wide(core::DedupConfig{.match_radius_arcsec = 2.0,
                                              .epoch_window = std::chrono::hours(3)});
    CHECK(wide.deduplicate({a, b}).targets.size() == 1);
}

TEST_CASE("Matches are transitive")
{
    // A-B and B-C are within 2", A-C is not
    const Target a = make("T1", ProviderId::Neocp, 200.0, 10.0);
    const Target b = make("T2", ProviderId::Scout, 200.0, 10.0 + 1.5 * kArcsec);
    const Target c = make("T3", ProviderId::Fink, 200.0, 10.0 + 3.0 * kArcsec);

    const Deduplicator dedup;
    CHECK_FALSE(dedup.matches(a, c));

    const DedupResult result = dedup.deduplicate({a, b, c});
    REQUIRE(result.targets.size() == 1);
    CHECK(result.targets.front().designation == "T1");
    CHECK(result.targets.front().aliases == std::vector<std::string>{"T2", "T3"});
    CHECK(result.targets.front().contributing_sources.size() == 3);
}

// =================================================================
// Name-based matching
// =================================================================

TEST_CASE("Declared aliases link records regardless of position")
{
    Target neocp = make("P21vSd3", ProviderId::Neocp, 121.884, 21.337);
    Target sentry = make("2026 CZ7", ProviderId::Sentry, 122.5, 21.0);
    sentry.aliases = {"p21vsd3"};
    sentry.impact_prob = 2.4e-5;

    const Deduplicator dedup;
    CHECK(dedup.matches(neocp, sentry));

    const DedupResult result = dedup.deduplicate({sentry, neocp});
    REQUIRE(result.targets.size() == 1);

    const Target& merged = result.targets.front();
    CHECK(merged.designation == "P21vSd3");
    CHECK(merged.aliases == std::vector<std::string>{"2026 CZ7"});
    CHECK(merged.impact_prob == 2.4e-5);
}

TEST_CASE("Same designation links records only through a shared provider")
{
    const Target earlier = make("C1", ProviderId::Neocp, 10.0, 10.0, kT0);
    const Target moved = make("C1", ProviderId::Neocp, 11.0, 10.0, kT0 + std::chrono::hours(3));
    const Target elsewhere = make("C1", ProviderId::Scout, 50.0, -20.0, kT0);

    const Deduplicator dedup;
    CHECK(dedup.matches(earlier, moved));
    CHECK_FALSE(dedup.matches(earlier, elsewhere));

    const DedupResult result = dedup.deduplicate({moved}, {earlier});
    REQUIRE(result.targets.size() == 1);
    CHECK(result.targets.front().ra_deg == doctest::Approx(11.0));
    CHECK(result.targets.front().epoch == moved.epoch);
    CHECK(result.retained == 0);
    CHECK(result.dropped == 0);

    CHECK(dedup.deduplicate({earlier, elsewhere}).targets.size() == 2);
}

// =================================================================
// Ambiguity
// =================================================================

TEST_CASE("One feed's two reports are never merged into one object")
{
    const Target x1 = make("X1", ProviderId::Neocp, 100.0, 20.0);
    const Target x2 = make("X2", ProviderId::Neocp, 100.0, 20.0 + 1.0 * kArcsec);

    const DedupResult result = Deduplicator().deduplicate({x1, x2});
    CHECK(result.targets.size() == 2);
    CHECK(result.ambiguities == 1);
}

TEST_CASE("A record between two conflicting reports joins the closer one")
{
    const Target x1 = make("X1", ProviderId::Neocp, 100.0, 20.0);
    const Target x2 = make("X2", ProviderId::Neocp, 100.0, 20.0 + 1.0 * kArcsec);
    const Target s1 = make("S1", ProviderId::Scout, 100.0, 20.0 + 0.4 * kArcsec);

    const DedupResult result = Deduplicator().deduplicate({x2, s1, x1});
    REQUIRE(result.targets.size() == 2);
    CHECK(result.ambiguities == 1);

    const Target* merged = find_by_designation(result, "X1");
    REQUIRE(merged != nullptr);
    CHECK(merged->aliases == std::vector<std::string>{"S1"});

    const Target* alone = find_by_designation(result, "X2");
    REQUIRE(alone != nullptr);
    CHECK(alone->aliases.empty());
    CHECK(alone->contributing_sources == std::set<ProviderId>{ProviderId::Neocp});
}

// =================================================================
// Field-wise merge
// =================================================================

TEST_CASE("merge takes the most recently updated value of each field")
{
    Target neocp = make("C4KBW22", ProviderId::Neocp, 5.127, 58.112, kT0);
    neocp.mag_v = 19.1;
    neocp.n_obs = 4;

    Target scout = make("C4KBW22", ProviderId::Scout, 5.128, 58.113, kT0 + std::chrono::minutes(10));
    scout.mag_v = 18.9;

    const Target merged = Deduplicator::merge({neocp, scout});
    CHECK(merged.mag_v == 18.9);
    CHECK(merged.n_obs == 4);
    CHECK(merged.updated_at == scout.updated_at);

    // Position comes whole from the latest epoch
    CHECK(merged.ra_deg == doctest::Approx(5.128));
    CHECK(merged.dec_deg == doctest::Approx(58.113));
    CHECK(merged.epoch == scout.epoch);
}

TEST_CASE("merge breaks update-time ties by provider priority")
{
    Target neocp = make("C4KBW22", ProviderId::Neocp, 5.127, 58.112);
    neocp.mag_v = 19.1;
    Target scout = make("C4KBW22", ProviderId::Scout, 5.127, 58.112);
    scout.mag_v = 18.9;

    CHECK(Deduplicator::merge({scout, neocp}).mag_v == 19.1);
    CHECK(Deduplicator::merge({neocp, scout}).mag_v == 19.1);
}

TEST_CASE("Fresh payloads replace the previous payload of the same feed")
{
    Target previous = make("C1", ProviderId::Neocp, 10.0, 10.0);
    previous.contributing_sources = {ProviderId::Neocp, ProviderId::Scout};
    previous.raw = {
        target::RawPayload{.provider = ProviderId::Neocp, .payload = "old"},
        target::RawPayload{.provider = ProviderId::Scout, .payload = "scout-old"},
    };

    Target fresh = make("C1", ProviderId::Neocp, 10.0, 10.0, kT0 + std::chrono::minutes(5));
    fresh.raw = {target::RawPayload{.provider = ProviderId::Neocp, .payload = "new"}};

    const DedupResult result = Deduplicator().deduplicate({fresh}, {previous});
    REQUIRE(result.targets.size() == 1);

    const auto& raw = result.targets.front().raw;
    REQUIRE(raw.size() == 2);
    CHECK(raw[0] == target::RawPayload{.provider = ProviderId::Neocp, .payload = "new"});
    CHECK(raw[1] == target::RawPayload{.provider = ProviderId::Scout, .payload = "scout-old"});
}

// =================================================================
// Retention of previous targets
// =================================================================

TEST_CASE("Unmatched previous targets survive only while a source is down")
{
    Target yk1 = make("2025 YK1", ProviderId::Sentry, 310.0, -5.0);
    yk1.impact_prob = 1.2e-4;

    SUBCASE("source failed this cycle")
    {
        const DedupResult result = Deduplicator().deduplicate({}, {yk1}, {ProviderId::Sentry});
        REQUIRE(result.targets.size() == 1);
        CHECK(result.retained == 1);
        CHECK(result.dropped == 0);
        CHECK(result.targets.front() == yk1);
    }

    SUBCASE("source answered without it")
    {
        const DedupResult result = Deduplicator().deduplicate({}, {yk1}, {ProviderId::Neocp});
        CHECK(result.targets.empty());
        CHECK(result.retained == 0);
        CHECK(result.dropped == 1);
    }
}

// =================================================================
// Order independence
// =================================================================

TEST_CASE("Result does not depend on input order")
{
    std::vector<Target> fresh = {
        make("C4KBW22", ProviderId::Neocp, 5.127, 58.112),
        make("C4KBW22", ProviderId::Scout, 5.12705, 58.11215),
        make("A11pQzD", ProviderId::Neocp, 150.0, 10.0),
        make("ZTF0Ab9", ProviderId::Fink, 150.0, 10.0 + 0.5 * kArcsec),
        make("X1", ProviderId::Neocp, 100.0, 20.0),
        make("X2", ProviderId::Neocp, 100.0, 20.0 + 1.0 * kArcsec),
        make("S1", ProviderId::Scout, 100.0, 20.0 + 0.5 * kArcsec),
        make("2026 CZ7", ProviderId::Sentry, 122.5, 21.0),
    };
    fresh.back().aliases = {"P21vSd3"};
    fresh.push_back(make("P21vSd3", ProviderId::Neocp, 121.884, 21.337));

    const Deduplicator dedup;
    const DedupResult baseline = dedup.deduplicate(fresh);

    std::mt19937 rng(20260215);
    for (int i = 0; i < 20; ++i)
    {
        std::shuffle(fresh.begin(), fresh.end(), rng);
        const DedupResult shuffled = dedup.deduplicate(fresh);
        CHECK(shuffled.targets == baseline.targets);
        CHECK(shuffled.ambiguities == baseline.ambiguities);
    }

    CHECK(std::is_sorted(baseline.targets.begin(), baseline.targets.end(),
                         [](const Target& a, const Target& b) { return a.designation < b.designation; }));
}

TEST_CASE("Deduplicating a merged set again changes nothing")
{
    const std::vector<Target> fresh = {
        make("C4KBW22", ProviderId::Neocp, 5.127, 58.112),
        make("C4KBW22", ProviderId::Scout, 5.12705, 58.11215),
        make("A11pQzD", ProviderId::Neocp, 150.0, 10.0),
    };

    const Deduplicator dedup;
    const DedupResult once = dedup.deduplicate(fresh);
    const DedupResult twice = dedup.deduplicate(once.targets);
    CHECK(twice.targets == once.targets);
}
