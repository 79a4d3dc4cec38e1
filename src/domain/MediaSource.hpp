/**
 * @file MediaSource.hpp
 * @brief Read access to the bytes of a file selected for transcription.
 */

#pragma once

#include "domain/TranscriptionJob.hpp"

#include <cstdint>
#include <string>

namespace scribeline::domain {

/**
 * @class MediaSource
 * @brief Byte-range reader over one media file.
 */
class MediaSource {
public:
    virtual ~MediaSource() = default;

    virtual SourceFile describe() const = 0;

    /** @brief False when the file could not be opened or stat'ed. */
    virtual bool isReadable() const = 0;

    /**
     * @brief Reads [offset, offset + length).
     * @throws TranscriptionError (Validation) on I/O failure or short read.
     */
    virtual std::string read(std::uint64_t offset, std::uint64_t length) const = 0;
};

} // namespace scribeline::domain
