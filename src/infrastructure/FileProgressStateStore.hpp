/**
 * @file FileProgressStateStore.hpp
 * @brief ProgressStateStore persisted as a small JSON file.
 */

#pragma once

#include "domain/ProgressStateStore.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace scribeline::infrastructure {

/**
 * @class FileProgressStateStore
 * @brief Writes go to a temp file that is renamed over the target, so a crash never leaves
 * a half-written record behind.
 */
class FileProgressStateStore : public domain::ProgressStateStore {
public:
    explicit FileProgressStateStore(std::filesystem::path path);

    /** @brief Missing or unreadable file means no record. A corrupt file is logged and ignored. */
    std::optional<domain::PersistedJobState> get() const override;

    /** @throws std::runtime_error when the record cannot be written. */
    void set(const domain::PersistedJobState& state) override;

    void clear() override;

    const std::filesystem::path& path() const { return m_path; }

    static nlohmann::json ToJson(const domain::PersistedJobState& state);
    static domain::PersistedJobState FromJson(const nlohmann::json& j);

private:
    void performAtomicWrite(const std::string& content) const;

    std::filesystem::path m_path;
};

} // namespace scribeline::infrastructure
