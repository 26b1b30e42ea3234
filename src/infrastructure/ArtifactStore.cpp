/**
 * @file ArtifactStore.cpp
 * @brief Implementation of ArtifactStore.
 */

#include "infrastructure/ArtifactStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace codeshift::infrastructure {

namespace fs = std::filesystem;

ArtifactStore::ArtifactStore(fs::path baseDir) : m_baseDir(std::move(baseDir)) {}

std::string ArtifactStore::FileNameFor(domain::Backend backend) {
    return "optimized_" + domain::BackendId(backend) + ".cpp";
}

fs::path ArtifactStore::pathFor(domain::Backend backend) const {
    return m_baseDir / FileNameFor(backend);
}

void ArtifactStore::ensureDirectory() const {
    std::error_code ec;
    fs::create_directories(m_baseDir, ec);
    if (ec) {
        throw domain::ArtifactError("Cannot create output directory " + m_baseDir.string() + ": " + ec.message());
    }
}

domain::ArtifactRecord ArtifactStore::write(const std::string& code, domain::Backend backend) {
    ensureDirectory();

    fs::path finalPath = pathFor(backend);
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::ArtifactError("Failed to open temp file: " + tempPath.string());
        }
        ofs << code;
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw domain::ArtifactError("Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw domain::ArtifactError("Rename to " + finalPath.string() + " failed: " + ec.message());
    }

    Logger::Info("ArtifactStore", "Saved " + domain::BackendDisplayName(backend) + " output to " + finalPath.string());
    return domain::ArtifactRecord{finalPath.string(), backend, code};
}

std::optional<std::string> ArtifactStore::read(domain::Backend backend) const {
    std::ifstream file(pathFor(backend), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace codeshift::infrastructure
