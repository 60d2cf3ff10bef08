/// @file snapshot.cpp
/// @brief Snapshot accessors.

#include "pipeline/snapshot.hpp"

namespace neoplan::pipeline
{

std::optional<SourceStatus> Snapshot::source(target::ProviderId id) const
{
    const auto it = sources.find(id);
    if (it == sources.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace neoplan::pipeline
