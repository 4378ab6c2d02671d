#pragma once

#include <string>
#include <filesystem>

namespace scribe {

/**
 * Where a model identifier's artifact lives upstream and in the cache.
 * "org/repo/path/file.bin" -> repo "org/repo", file "path/file.bin";
 * "org/repo" -> the configured default file.
 */
struct ArtifactLocation {
    std::string repo;
    std::string file;
};

ArtifactLocation locateArtifact(const std::string& identifier, const std::string& defaultFile);

// Existing copy of file under any snapshot of modelDir, "main" first.
// Empty if there is none.
std::filesystem::path findArtifact(const std::filesystem::path& modelDir, const std::string& file);

// Final location of a fresh download: snapshots/main/<file>
std::filesystem::path snapshotPath(const std::filesystem::path& modelDir, const std::string& file);

// Scratch file the download is written to before it is moved into place
std::filesystem::path partialPath(const std::filesystem::path& modelDir, const std::string& file);

} // namespace scribe
