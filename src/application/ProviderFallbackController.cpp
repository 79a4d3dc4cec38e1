/**
 * @file ProviderFallbackController.cpp
 * @brief Implementation of ProviderFallbackController.
 */

#include "application/ProviderFallbackController.hpp"

#include "domain/TranscriptionError.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <variant>

namespace scribeline::application {

namespace {

std::string FormatMegabytes(std::uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    return out.str();
}

} // namespace

ProviderFallbackController::ProviderFallbackController(std::uint64_t directUploadThresholdBytes)
    : m_directUploadThresholdBytes(directUploadThresholdBytes) {}

RouteDecision ProviderFallbackController::decide(const domain::CredentialResponse& response,
                                                 const domain::SourceFile& file) const {
    RouteDecision decision;
    if (const auto* credential = std::get_if<domain::UploadCredential>(&response)) {
        decision.provider = domain::Provider::Primary;
        decision.credential = *credential;
        return decision;
    }

    const auto& directive = std::get<domain::FallbackDirective>(response);
    if (file.byteSize > directive.maxFallbackSizeBytes) {
        std::ostringstream message;
        message << "File " << file.name << " is " << FormatMegabytes(file.byteSize)
                << ". The primary provider is unavailable (" << directive.reason
                << ") and the fallback accepts at most " << FormatMegabytes(directive.maxFallbackSizeBytes)
                << "; single direct uploads are limited to " << FormatMegabytes(m_directUploadThresholdBytes) << ".";
        throw domain::TranscriptionError(domain::ErrorKind::PayloadTooLarge, message.str(),
            "Compress the file or split it into parts smaller than " +
            FormatMegabytes(directive.maxFallbackSizeBytes) + ", or retry once the primary provider is back.");
    }

    std::cout << "[ProviderFallbackController] Routing " << file.name << " to fallback: "
              << (directive.message.empty() ? directive.reason : directive.message) << std::endl;
    decision.provider = domain::Provider::Fallback;
    decision.directive = directive;
    return decision;
}

} // namespace scribeline::application
