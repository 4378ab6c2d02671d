#include "model_artifact.h"
#include <system_error>

namespace fs = std::filesystem;

namespace scribe {

ArtifactLocation locateArtifact(const std::string& identifier, const std::string& defaultFile) {
    ArtifactLocation location;

    size_t first = identifier.find('/');
    size_t second = first == std::string::npos ? std::string::npos : identifier.find('/', first + 1);
    if (second == std::string::npos) {
        location.repo = identifier;
        location.file = defaultFile;
    } else {
        location.repo = identifier.substr(0, second);
        location.file = identifier.substr(second + 1);
    }
    return location;
}

fs::path findArtifact(const fs::path& modelDir, const std::string& file) {
    std::error_code ec;
    fs::path preferred = snapshotPath(modelDir, file);
    if (fs::is_regular_file(preferred, ec)) {
        return preferred;
    }

    fs::directory_iterator it(modelDir / "snapshots", ec);
    if (ec) {
        return {};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return {};
        }
        fs::path candidate = it->path() / file;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

fs::path snapshotPath(const fs::path& modelDir, const std::string& file) {
    return modelDir / "snapshots" / "main" / file;
}

fs::path partialPath(const fs::path& modelDir, const std::string& file) {
    return modelDir / "blobs" / (fs::path(file).filename().string() + ".incomplete");
}

} // namespace scribe
