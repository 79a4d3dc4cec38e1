/**
 * @file TranscriptionError.hpp
 * @brief Error taxonomy shared by every stage of the transcription pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace scribeline::domain {

/**
 * @enum ErrorKind
 * @brief Classifies a failure so callers can decide between retrying, failing fast or reporting.
 */
enum class ErrorKind {
    Validation,         ///< Rejected locally before planning (empty or unreadable file, unconfirmed cost).
    NetworkTransient,   ///< Timeout, abort, connection reset. The only retryable kind.
    AuthOrBilling,      ///< Credential, permission or billing rejection from the provider.
    InvalidRequest,     ///< Malformed-request response (400/422).
    PayloadTooLarge,    ///< File exceeds the direct-upload and fallback limits.
    UnsupportedFormat,  ///< Media type refused.
    JobFailed,          ///< Provider reported a job-level failure after the upload succeeded.
    PollExhausted,      ///< Poll ceiling reached without a terminal provider answer.
    Cancelled           ///< Stopped by an explicit cancel.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::NetworkTransient: return "NetworkTransient";
        case ErrorKind::AuthOrBilling: return "AuthOrBilling";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::JobFailed: return "JobFailed";
        case ErrorKind::PollExhausted: return "PollExhausted";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline bool IsRetryable(ErrorKind kind) {
    return kind == ErrorKind::NetworkTransient;
}

/**
 * @brief Default remediation text shown next to an error of the given kind.
 */
inline std::string DefaultRemediation(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:
            return "Check that the file exists, is readable and is not empty.";
        case ErrorKind::NetworkTransient:
            return "Check your network connection and try again.";
        case ErrorKind::AuthOrBilling:
            return "Check the transcription account credentials and billing status.";
        case ErrorKind::InvalidRequest:
            return "The provider rejected the request; check the file and the client configuration.";
        case ErrorKind::PayloadTooLarge:
            return "Split or compress the file before submitting it again.";
        case ErrorKind::UnsupportedFormat:
            return "Convert the file to a supported audio format (M4A, MP3, WAV).";
        case ErrorKind::JobFailed:
            return "The provider could not transcribe this file; see the reason reported.";
        case ErrorKind::PollExhausted:
            return "The provider did not finish in time; check the job later with its id.";
        case ErrorKind::Cancelled:
            return "Submit the file again to restart the transcription.";
    }
    return {};
}

/**
 * @class TranscriptionError
 * @brief Exception raised by ports and carried as a value across asynchronous boundaries.
 */
class TranscriptionError : public std::runtime_error {
public:
    TranscriptionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind), m_remediation(DefaultRemediation(kind)) {}

    TranscriptionError(ErrorKind kind, const std::string& message, std::string remediation)
        : std::runtime_error(message), m_kind(kind), m_remediation(std::move(remediation)) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& remediation() const { return m_remediation; }
    bool retryable() const { return IsRetryable(m_kind); }

    /** @brief "Kind: message" form used in logs and batch summaries. */
    std::string describe() const {
        return ErrorKindToString(m_kind) + ": " + what();
    }

private:
    ErrorKind m_kind;
    std::string m_remediation;
};

} // namespace scribeline::domain
