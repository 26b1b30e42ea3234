/**
 * @file ArtifactStore.hpp
 * @brief Filesystem persistence of generated code, one file per backend.
 */

#pragma once
#include "domain/Conversion.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace codeshift::infrastructure {

/**
 * @class ArtifactStore
 * @brief Writes normalized code to <baseDir>/optimized_<backendId>.cpp.
 *
 * A write replaces the previous artifact of the same backend; no history is kept.
 */
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path baseDir);

    /**
     * @brief Persists @p code for @p backend, replacing any previous artifact.
     * @throws domain::ArtifactError when the directory or file cannot be written.
     */
    domain::ArtifactRecord write(const std::string& code, domain::Backend backend);

    /** @brief Deterministic artifact path for @p backend. Depends on nothing else. */
    std::filesystem::path pathFor(domain::Backend backend) const;

    /** @brief Current artifact content, if one was written. */
    std::optional<std::string> read(domain::Backend backend) const;

    /** @brief Creates the base directory. Calling it again is a no-op. */
    void ensureDirectory() const;

    const std::filesystem::path& baseDir() const { return m_baseDir; }

    /** @brief "optimized_<id>.cpp" */
    static std::string FileNameFor(domain::Backend backend);

private:
    std::filesystem::path m_baseDir;
};

} // namespace codeshift::infrastructure
