/// @file test_config.cpp
/// @brief Unit tests for neoplan::core configuration loading, validation and logger lifecycle.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <cstdlib>

using namespace neoplan;
using namespace neoplan::core;

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
// Helper: scoped environment variable
// =================================================================

class ScopedEnv
{
public:
    ScopedEnv(const char* name, const char* value)
        : m_name(name)
    {
        ::setenv(name, value, 1);
    }

    ~ScopedEnv()
    {
        ::unsetenv(m_name);
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* m_name;
};

// =================================================================
// Defaults
// =================================================================

TEST_CASE("Defaults match the documented values")
{
    const PipelineConfig config;
    CHECK(config.refresh.interval == std::chrono::minutes(5));
    CHECK(config.refresh.fetch_timeout == std::chrono::seconds(10));
    CHECK(config.dedup.match_radius_arcsec == doctest::Approx(2.0));
    CHECK(config.dedup.epoch_window == std::chrono::hours(1));
    CHECK(config.observability.sun_step == std::chrono::minutes(15));
    CHECK(config.observability.horizon == std::chrono::hours(24));
    CHECK(config.observability.target_step == std::chrono::minutes(10));
    CHECK(config.weights.impact == doctest::Approx(3.0));
    CHECK(config.weights.pha == doctest::Approx(1.5));
    CHECK_FALSE(validate_config(config).has_value());
}

// =================================================================
// Environment overrides
// =================================================================

TEST_CASE("Environment overrides replace defaults")
{
    const ScopedEnv refresh("NEOPLAN_REFRESH_SECONDS", "60");
    const ScopedEnv timeout("NEOPLAN_FETCH_TIMEOUT_SECONDS", "2.5");
    const ScopedEnv radius("NEOPLAN_MATCH_RADIUS_ARCSEC", "3");
    const ScopedEnv window("NEOPLAN_EPOCH_WINDOW_MINUTES", "30");
    const ScopedEnv feeds("NEOPLAN_FEED_DIR", "/tmp/feeds");

    const PipelineConfig config = load_config_from_environment();
    CHECK(config.refresh.interval == std::chrono::seconds(60));
    CHECK(config.refresh.fetch_timeout == std::chrono::milliseconds(2500));
    CHECK(config.dedup.match_radius_arcsec == doctest::Approx(3.0));
    CHECK(config.dedup.epoch_window == std::chrono::minutes(30));
    CHECK(config.feed_dir == "/tmp/feeds");
}

TEST_CASE("Unparsable or non-positive values are ignored")
{
    const ScopedEnv refresh("NEOPLAN_REFRESH_SECONDS", "soon");
    const ScopedEnv timeout("NEOPLAN_FETCH_TIMEOUT_SECONDS", "-1");
    const ScopedEnv radius("NEOPLAN_MATCH_RADIUS_ARCSEC", "2x");

    const PipelineConfig config = load_config_from_environment();
    CHECK(config.refresh.interval == std::chrono::minutes(5));
    CHECK(config.refresh.fetch_timeout == std::chrono::seconds(10));
    CHECK(config.dedup.match_radius_arcsec == doctest::Approx(2.0));
}

// =================================================================
// Validation
// =================================================================

TEST_CASE("validate_config rejects non-positive steps and thresholds")
{
    PipelineConfig config;

    SUBCASE("interval") { config.refresh.interval = std::chrono::milliseconds(0); }
    SUBCASE("timeout") { config.refresh.fetch_timeout = std::chrono::milliseconds(-5); }
    SUBCASE("radius") { config.dedup.match_radius_arcsec = 0.0; }
    SUBCASE("sun step") { config.observability.sun_step = std::chrono::minutes(0); }
    SUBCASE("target step") { config.observability.target_step = std::chrono::minutes(0); }
    SUBCASE("horizon") { config.observability.horizon = std::chrono::hours(0); }
    SUBCASE("arc floor") { config.weights.arc_floor_days = 0.0; }

    CHECK(validate_config(config).has_value());
}

// =================================================================
// Logger lifecycle
// =================================================================

TEST_CASE("Loggers exist only between init() and shutdown()")
{
    REQUIRE(Logger::get_core_logger() != nullptr);
    const auto core_before = Logger::get_core_logger();

    // A second init() keeps the live loggers
    Logger::init();
    CHECK(Logger::get_core_logger() == core_before);

    Logger::shutdown();
    CHECK(Logger::get_core_logger() == nullptr);
    CHECK(Logger::get_app_logger() == nullptr);

    // Reading the accessors again does not bring them back
    CHECK(Logger::get_core_logger() == nullptr);

    Logger::init();
    REQUIRE(Logger::get_core_logger() != nullptr);
    REQUIRE(Logger::get_app_logger() != nullptr);
    CHECK(Logger::get_core_logger()->name() == "NEOPLAN");
    CHECK(Logger::get_app_logger()->name() == "APP");
}
