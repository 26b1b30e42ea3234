/**
 * @file ProviderGateway.hpp
 * @brief Interface for submitting a conversion request to a generative backend.
 */

#pragma once
#include "domain/Conversion.hpp"
#include "domain/FragmentStream.hpp"

namespace codeshift::domain {

/**
 * @class ProviderGateway
 * @brief Abstract interface hiding whether a backend streams or answers in one piece.
 */
class ProviderGateway {
public:
    virtual ~ProviderGateway() = default;

    /** @brief Backend served by this gateway. */
    virtual Backend backend() const = 0;

    /**
     * @brief Prepares a call for @p request without touching the network.
     * @param request The conversion input.
     * @return A single-use stream; consuming it performs the call.
     * @throws RequestError (Credential) when no API key is configured.
     */
    virtual FragmentStream submit(const ConversionRequest& request) = 0;
};

} // namespace codeshift::domain
