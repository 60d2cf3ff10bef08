#pragma once

/// @file provider_registry.hpp
/// @brief Set of adapters selected at startup, at most one per ProviderId.

#include "providers/provider.hpp"

#include <memory>
#include <vector>

namespace neoplan::providers
{
    class ProviderRegistry
    {
    public:
        /// @brief Register an adapter.
        /// @return false (and logs) if the adapter is null or its id is already registered.
        bool add(std::shared_ptr<TargetProvider> provider);

        /// @brief Adapter registered for an id, or nullptr.
        [[nodiscard]] std::shared_ptr<TargetProvider> find(target::ProviderId id) const;

        /// @brief All adapters, in registration order.
        [[nodiscard]] const std::vector<std::shared_ptr<TargetProvider>>& providers() const { return m_providers; }

        [[nodiscard]] std::size_t size() const { return m_providers.size(); }
        [[nodiscard]] bool empty() const { return m_providers.empty(); }

    private:
        std::vector<std::shared_ptr<TargetProvider>> m_providers;
    };

} // namespace neoplan::providers
