/**
 * @file ProviderFallbackController.hpp
 * @brief Chooses between the primary and the fallback transcription route.
 */

#pragma once

#include "domain/TranscriptionJob.hpp"
#include "domain/UploadCredential.hpp"

#include <cstdint>
#include <optional>

namespace scribeline::application {

/**
 * @struct RouteDecision
 * @brief Exactly one of credential or directive is set, matching the chosen provider.
 */
struct RouteDecision {
    domain::Provider provider = domain::Provider::Primary;
    std::optional<domain::UploadCredential> credential;
    std::optional<domain::FallbackDirective> directive;
};

class ProviderFallbackController {
public:
    explicit ProviderFallbackController(std::uint64_t directUploadThresholdBytes);

    /**
     * @brief Maps the broker response to a route.
     *
     * A fallback directive is honoured only when the file fits the fallback limit.
     * @throws TranscriptionError (PayloadTooLarge) naming both limits otherwise. Nothing has
     * been uploaded at that point.
     */
    RouteDecision decide(const domain::CredentialResponse& response, const domain::SourceFile& file) const;

private:
    std::uint64_t m_directUploadThresholdBytes;
};

} // namespace scribeline::application
