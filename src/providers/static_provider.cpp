/// @file static_provider.cpp
/// @brief StaticProvider implementation.

#include "providers/static_provider.hpp"

#include "core/logger.hpp"

#include <stdexcept>
#include <thread>

namespace neoplan::providers
{

StaticProvider::StaticProvider(target::ProviderId id, std::vector<target::Target> records)
    : m_id(id)
    , m_records(std::move(records))
{
}

FetchResult StaticProvider::fetch(std::chrono::milliseconds /*timeout*/)
{
    ++m_fetch_count;

    std::chrono::milliseconds latency{0};
    {
        const std::lock_guard lock(m_mutex);
        latency = m_latency;
    }
    if (latency.count() > 0)
    {
        std::this_thread::sleep_for(latency);
    }

    std::vector<target::Target> records;
    {
        const std::lock_guard lock(m_mutex);
        if (m_throw_message)
        {
            throw std::runtime_error(*m_throw_message);
        }
        if (m_failure)
        {
            return FetchResult::failure(m_failure->kind, m_failure->message);
        }
        records = m_records;
    }

    // Normalize: every record is attributed to this feed; invalid ones are skipped.
    std::vector<target::Target> accepted;
    std::vector<core::ProviderError> skipped;
    accepted.reserve(records.size());

    for (auto& record : records)
    {
        record.source = m_id;
        record.contributing_sources = {m_id};

        if (const auto problem = target::validate_target(record))
        {
            NPL_CORE_WARN("StaticProvider[{}]: skipping '{}': {}",
                          target::provider_name(m_id), record.designation, *problem);
            skipped.push_back(core::ProviderError{
                .kind    = core::ProviderErrorKind::Parse,
                .message = record.designation + ": " + *problem,
            });
            continue;
        }
        accepted.push_back(std::move(record));
    }

    return FetchResult::success(std::move(accepted), std::move(skipped));
}

void StaticProvider::set_records(std::vector<target::Target> records)
{
    const std::lock_guard lock(m_mutex);
    m_records = std::move(records);
    m_failure.reset();
    m_throw_message.reset();
}

void StaticProvider::set_failure(core::ProviderErrorKind kind, std::string message)
{
    const std::lock_guard lock(m_mutex);
    m_failure = core::ProviderError{.kind = kind, .message = std::move(message)};
}

void StaticProvider::set_throw(std::string message)
{
    const std::lock_guard lock(m_mutex);
    m_throw_message = std::move(message);
}

void StaticProvider::set_latency(std::chrono::milliseconds latency)
{
    const std::lock_guard lock(m_mutex);
    m_latency = latency;
}

} // namespace neoplan::providers
