/**
 * @file FileMediaSource.hpp
 * @brief MediaSource over a file on the local filesystem.
 */

#pragma once

#include "domain/MediaSource.hpp"

#include <filesystem>

namespace scribeline::infrastructure {

class FileMediaSource : public domain::MediaSource {
public:
    /** @brief Stats the file once; a missing file yields an unreadable source of size 0. */
    explicit FileMediaSource(std::filesystem::path path);

    domain::SourceFile describe() const override { return m_file; }
    bool isReadable() const override { return m_readable; }
    std::string read(std::uint64_t offset, std::uint64_t length) const override;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
    domain::SourceFile m_file;
    bool m_readable = false;
};

} // namespace scribeline::infrastructure
