/**
 * @file FileProgressStateStore.cpp
 * @brief Implementation of FileProgressStateStore.
 */

#include "infrastructure/FileProgressStateStore.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scribeline::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

FileProgressStateStore::FileProgressStateStore(fs::path path) : m_path(std::move(path)) {}

json FileProgressStateStore::ToJson(const domain::PersistedJobState& state) {
    json j = {
        {"jobId", state.jobId},
        {"status", domain::StatusToString(state.status)},
        {"progressPercent", state.progressPercent},
        {"etaSeconds", state.etaSeconds},
        {"updatedAt", ToEpochMillis(state.updatedAt)},
        {"fileName", state.fileName},
        {"provider", domain::ProviderToString(state.provider)}
    };
    return j;
}

domain::PersistedJobState FileProgressStateStore::FromJson(const json& j) {
    domain::PersistedJobState state;
    state.jobId = j.value("jobId", std::string());
    const std::string status = j.value("status", std::string("idle"));
    auto parsed = domain::ParseStatus(status);
    if (!parsed) {
        throw std::runtime_error("Unknown job status '" + status + "'");
    }
    state.status = *parsed;
    state.progressPercent = j.value("progressPercent", 0);
    state.etaSeconds = j.value("etaSeconds", 0LL);
    state.updatedAt = FromEpochMillis(j.value("updatedAt", 0LL));
    state.fileName = j.value("fileName", std::string());
    state.provider = domain::ParseProvider(j.value("provider", std::string("primary")));
    return state;
}

std::optional<domain::PersistedJobState> FileProgressStateStore::get() const {
    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(m_path);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[StateStore] Ignoring unreadable state file " << m_path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void FileProgressStateStore::set(const domain::PersistedJobState& state) {
    performAtomicWrite(ToJson(state).dump(2));
}

void FileProgressStateStore::clear() {
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[StateStore] Could not remove " << m_path << ": " << ec.message() << std::endl;
    }
}

void FileProgressStateStore::performAtomicWrite(const std::string& content) const {
    // Unique temp path: <file>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path());
    }

    {
        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Write failed for " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Rename to " + m_path.string() + " failed: " + ec.message());
    }
}

} // namespace scribeline::infrastructure
