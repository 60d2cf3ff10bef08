/// @file provider_registry.cpp
/// @brief ProviderRegistry implementation.

#include "providers/provider_registry.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace neoplan::providers
{

bool ProviderRegistry::add(std::shared_ptr<TargetProvider> provider)
{
    if (!provider)
    {
        NPL_CORE_ERROR("ProviderRegistry: refusing null adapter");
        return false;
    }

    if (find(provider->id()))
    {
        NPL_CORE_WARN("ProviderRegistry: '{}' already registered, ignoring duplicate",
                      target::provider_name(provider->id()));
        return false;
    }

    NPL_CORE_INFO("ProviderRegistry: registered '{}'", provider->name());
    m_providers.push_back(std::move(provider));
    return true;
}

std::shared_ptr<TargetProvider> ProviderRegistry::find(target::ProviderId id) const
{
    const auto it = std::find_if(m_providers.begin(), m_providers.end(),
                                 [id](const auto& p) { return p->id() == id; });
    return it != m_providers.end() ? *it : nullptr;
}

} // namespace neoplan::providers
