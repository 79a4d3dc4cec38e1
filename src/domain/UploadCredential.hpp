/**
 * @file UploadCredential.hpp
 * @brief Ephemeral upload credential and the broker's fallback directive.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace scribeline::domain {

/**
 * @struct UploadCredential
 * @brief Single-use, time-bounded permission to upload one payload. Never persisted.
 */
struct UploadCredential {
    std::string uploadUrl;
    std::string authToken;
    std::chrono::system_clock::time_point issuedAt{};
};

/**
 * @struct FallbackDirective
 * @brief Broker instruction to route the job through the fallback provider.
 */
struct FallbackDirective {
    std::string reason;
    std::uint64_t maxFallbackSizeBytes = 0;
    std::string message;
};

using CredentialResponse = std::variant<UploadCredential, FallbackDirective>;

} // namespace scribeline::domain
