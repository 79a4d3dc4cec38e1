/**
 * @file CredentialBroker.hpp
 * @brief Interface to the trusted backend that issues upload credentials.
 */

#pragma once

#include "domain/TranscriptionJob.hpp"
#include "domain/UploadCredential.hpp"

namespace scribeline::domain {

/**
 * @class CredentialBroker
 * @brief Issues ephemeral upload credentials, or tells the client to use the fallback provider.
 *
 * Implementations throw TranscriptionError when the broker cannot be reached or refuses the request.
 */
class CredentialBroker {
public:
    virtual ~CredentialBroker() = default;

    /**
     * @brief Requests a fresh credential for one payload.
     * @param fileMeta Name, size and MIME type of the payload (the whole file or one chunk).
     */
    virtual CredentialResponse requestUploadCredential(const SourceFile& fileMeta) = 0;
};

} // namespace scribeline::domain
