#pragma once

/// @file errors.hpp
/// @brief Error values and exceptions used across the pipeline.

#include <stdexcept>
#include <string>

namespace neoplan::core
{
    /// @brief Failure category reported by a provider adapter.
    enum class ProviderErrorKind
    {
        Timeout,    ///< Fetch exceeded its deadline
        Transport,  ///< Feed unreachable, I/O failure, or an exception escaped the adapter
        Parse,      ///< Payload or single record could not be decoded
    };

    inline const char* error_kind_name(ProviderErrorKind kind)
    {
        switch (kind)
        {
            case ProviderErrorKind::Timeout:   return "timeout";
            case ProviderErrorKind::Transport: return "transport";
            case ProviderErrorKind::Parse:     return "parse";
            default:                           return "unknown";
        }
    }

    /// @brief A provider failure, carried by value.
    ///
    /// Timeout and Transport failures void the provider's whole contribution
    /// for one cycle. Parse failures attached to a successful fetch only
    /// describe records that were skipped.
    struct ProviderError
    {
        ProviderErrorKind kind{ProviderErrorKind::Transport};
        std::string       message;

        [[nodiscard]] std::string describe() const
        {
            return std::string(error_kind_name(kind)) + ": " + message;
        }

        bool operator==(const ProviderError&) const = default;
    };

    /// @brief Thrown synchronously by ranking when the caller's profile is out of domain.
    ///
    /// Values are never clamped into range.
    class InvalidProfileError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace neoplan::core
