// src/main.cpp - neoplan demo entry point
//
// Walks through one pass of the pipeline:
//  1. Load configuration
//  2. Register a CSV adapter for every feed file found
//  3. Run one refresh cycle
//  4. Print source health
//  5. Print tonight's ranked list for the Wallace preset

#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "observatory/observability_engine.hpp"
#include "observatory/telescope_profile.hpp"
#include "pipeline/refresh_orchestrator.hpp"
#include "pipeline/snapshot_store.hpp"
#include "pipeline/target_query.hpp"
#include "providers/csv_provider.hpp"
#include "providers/provider_registry.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace neoplan;

namespace
{

std::string format_optional_time(const std::optional<Instant>& t)
{
    return t ? astro::TimeSystem::format_iso8601(*t) : std::string("never");
}

} // anonymous namespace

int main()
{
    core::Logger::init();

    std::cout << "================================================================\n"
              << "  NEOPLAN v0.1 - NEO follow-up target planner\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    const core::PipelineConfig config = core::load_config_from_environment();
    if (const auto problem = core::validate_config(config))
    {
        NPL_CRITICAL("Invalid configuration: {}", *problem);
        core::Logger::shutdown();
        return 1;
    }

    // -----------------------------------------------------------------------
    // 2. Providers: one CSV feed per file, named after the provider
    // -----------------------------------------------------------------------
    providers::ProviderRegistry registry;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(config.feed_dir, ec))
    {
        if (entry.path().extension() != ".csv")
        {
            continue;
        }
        const auto id = target::provider_from_name(entry.path().stem().string());
        if (!id)
        {
            NPL_WARN("Skipping feed '{}': no provider of that name", entry.path().string());
            continue;
        }
        static_cast<void>(registry.add(std::make_shared<providers::CsvProvider>(*id, entry.path())));
    }
    if (ec)
    {
        NPL_ERROR("Cannot read feed directory '{}': {}", config.feed_dir, ec.message());
    }

    std::cout << "Feeds in " << config.feed_dir << ": " << registry.size() << " registered\n\n";

    // -----------------------------------------------------------------------
    // 3. One refresh cycle
    // -----------------------------------------------------------------------
    pipeline::SnapshotStore store;
    pipeline::RefreshOrchestrator orchestrator(registry, store, config);
    const pipeline::CycleReport report = orchestrator.run_cycle();

    std::cout << "Refresh cycle: " << pipeline::outcome_name(report.outcome) << "\n";
    for (const auto& p : report.providers)
    {
        std::cout << "  " << std::left << std::setw(8) << target::provider_name(p.id)
                  << p.records << " records, " << p.skipped << " skipped";
        if (p.error)
        {
            std::cout << "  [" << p.error->describe() << "]";
        }
        std::cout << "\n";
    }
    std::cout << "  Merged targets: " << report.merged_targets
              << " (" << report.ambiguities << " ambiguous matches)\n\n";

    // -----------------------------------------------------------------------
    // 4. Health
    // -----------------------------------------------------------------------
    const pipeline::SnapshotPtr snapshot = store.current();
    const pipeline::HealthStatus health = pipeline::status(snapshot);
    std::cout << "Snapshot: " << (health.ready ? "ready" : "not ready")
              << ", v" << health.version
              << (health.stale ? " (stale)" : "")
              << ", published " << format_optional_time(health.published_at) << "\n";
    for (const auto& p : health.providers)
    {
        std::cout << "  " << std::left << std::setw(8) << target::provider_name(p.id)
                  << "last success " << format_optional_time(p.last_success_at) << "\n";
    }
    std::cout << "\n";

    // -----------------------------------------------------------------------
    // 5. Tonight's list
    // -----------------------------------------------------------------------
    const observatory::TelescopeProfile profile = observatory::make_wallace_profile();
    const Instant now = Clock::now();

    std::cout << "Observatory: " << profile.name << " (" << profile.code.value_or("-") << ")\n"
              << "  Lat: " << std::fixed << std::setprecision(4) << profile.lat_deg << " deg N\n"
              << "  Lon: " << profile.lon_deg << " deg E\n"
              << "  Limiting mag: " << std::setprecision(1) << profile.limiting_mag << "\n";

    if (const auto dark = observatory::ObservabilityEngine::dark_window(profile, now, config.observability))
    {
        std::cout << "  Dark window: " << astro::TimeSystem::format_iso8601(dark->start)
                  << " -> " << astro::TimeSystem::format_iso8601(dark->end) << "\n\n";
    }
    else
    {
        std::cout << "  No dark window in the next "
                  << config.observability.horizon.count() << " h\n\n";
    }

    const auto ranked = pipeline::rank(snapshot, profile, config.weights, 20, now, config.observability);

    std::cout << std::right
              << std::setw(3) << "#" << "  " << std::left << std::setw(12) << "Target"
              << std::right << std::setw(7) << "Score" << std::setw(7) << "V"
              << std::setw(8) << "Alt" << std::setw(8) << "Hours" << "  Best at\n";
    for (const auto& r : ranked)
    {
        std::cout << std::right << std::setw(3) << r.rank << "  "
                  << std::left << std::setw(12) << r.target.designation
                  << std::right << std::setprecision(1)
                  << std::setw(7) << r.score
                  << std::setw(7) << r.target.mag_v.value_or(0.0)
                  << std::setw(8) << r.observability.best_altitude_deg.value_or(0.0)
                  << std::setw(8) << r.observability.obs_window_hours
                  << "  " << format_optional_time(r.observability.transit_time) << "\n";
    }
    if (ranked.empty())
    {
        std::cout << "  (nothing observable tonight)\n";
    }

    std::cout << "\n================================================================\n"
              << "  Clear skies.\n"
              << "================================================================\n";

    core::Logger::shutdown();
    return 0;
}
