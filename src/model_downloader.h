#pragma once

#include <string>
#include <functional>
#include <filesystem>

namespace scribe {

/**
 * Fetches model artifacts over HTTP(S) with libcurl.
 */
class ModelDownloader {
public:
    using ProgressCallback = std::function<void(int percent)>;

    explicit ModelDownloader(std::string endpoint);

    // Process-wide libcurl setup, call once before any download
    static bool globalInit(std::string& error);
    static void globalCleanup();

    // "<endpoint>/<repo>/resolve/main/<file>"
    std::string urlFor(const std::string& repo, const std::string& file) const;

    /**
     * Download url into partialPath, then move it to destination. The
     * partial file is removed on failure, so destination only ever holds a
     * complete artifact.
     */
    bool download(const std::string& url, const std::filesystem::path& partialPath,
                  const std::filesystem::path& destination, ProgressCallback progress);

    const std::string& getLastError() const { return m_lastError; }

private:
    std::string m_endpoint;
    std::string m_lastError;
};

} // namespace scribe
