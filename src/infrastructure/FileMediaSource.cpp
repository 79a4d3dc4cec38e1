/**
 * @file FileMediaSource.cpp
 * @brief Implementation of FileMediaSource.
 */

#include "infrastructure/FileMediaSource.hpp"

#include "domain/TranscriptionError.hpp"
#include "infrastructure/MediaUtils.hpp"

#include <fstream>

namespace scribeline::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::TranscriptionError;

FileMediaSource::FileMediaSource(fs::path path) : m_path(std::move(path)) {
    m_file.name = m_path.filename().string();
    m_file.mimeType = MediaUtils::GuessMimeType(m_path.string());

    std::error_code ec;
    const auto size = fs::file_size(m_path, ec);
    if (!ec && fs::is_regular_file(m_path, ec)) {
        m_file.byteSize = static_cast<std::uint64_t>(size);
        std::ifstream probe(m_path, std::ios::binary);
        m_readable = probe.is_open();
    }
}

std::string FileMediaSource::read(std::uint64_t offset, std::uint64_t length) const {
    if (offset + length > m_file.byteSize) {
        throw TranscriptionError(ErrorKind::Validation,
            "Range " + std::to_string(offset) + "+" + std::to_string(length) + " is outside " + m_file.name);
    }
    std::ifstream in(m_path, std::ios::binary);
    if (!in.is_open()) {
        throw TranscriptionError(ErrorKind::Validation, "Cannot open " + m_path.string());
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::string buffer(static_cast<std::size_t>(length), '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(in.gcount()) != length) {
        throw TranscriptionError(ErrorKind::Validation, "Short read from " + m_path.string());
    }
    return buffer;
}

} // namespace scribeline::infrastructure
