#pragma once

#include <string>
#include <functional>
#include <filesystem>

namespace scribe {

// Decides whether a model directory holds a finished download
using CompletenessCheck = std::function<bool(const std::filesystem::path& modelDir)>;

/**
 * Model identifiers look like "namespace/name" or "namespace/name/file".
 * Components must be non-empty, must not be "." or "..", and must not
 * contain "--" or backslashes, so that cacheKey() is injective.
 */
bool isValidIdentifier(const std::string& identifier);

// Human readable name: everything after the last '/'
std::string shortName(const std::string& identifier);

// "org/model" -> "models--org--model"
std::string cacheKey(const std::string& identifier);

// Default completeness check: a regular file somewhere under snapshots/
bool hasSnapshot(const std::filesystem::path& modelDir);

/**
 * Read-only view of the on-disk model cache.
 * Never throws; any filesystem problem reads as "not cached".
 */
class ModelCache {
public:
    explicit ModelCache(std::filesystem::path root, CompletenessCheck isComplete = hasSnapshot);

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path modelDir(const std::string& identifier) const;

    bool isCached(const std::string& identifier) const;

private:
    std::filesystem::path m_root;
    CompletenessCheck m_isComplete;
};

// Create the directory (and parents) if needed
bool ensureDirectory(const std::filesystem::path& dir, std::string& error);

} // namespace scribe
