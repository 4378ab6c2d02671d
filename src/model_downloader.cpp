#include "model_downloader.h"
#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace scribe {

namespace {

struct TransferState {
    std::ofstream* file = nullptr;
    ModelDownloader::ProgressCallback* progress = nullptr;
    int lastPercent = -1;
};

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    const size_t bytes = size * nmemb;
    state->file->write(data, static_cast<std::streamsize>(bytes));
    // Returning a short count makes curl abort with CURLE_WRITE_ERROR
    return state->file->good() ? bytes : 0;
}

int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(clientp);
    if (dltotal <= 0 || !state->progress || !*state->progress) {
        return 0;
    }
    const int percent = static_cast<int>((dlnow * 100) / dltotal);
    if (percent != state->lastPercent) {
        state->lastPercent = percent;
        (*state->progress)(percent);
    }
    return 0;
}

} // namespace

ModelDownloader::ModelDownloader(std::string endpoint)
    : m_endpoint(std::move(endpoint))
{
    while (!m_endpoint.empty() && m_endpoint.back() == '/') {
        m_endpoint.pop_back();
    }
}

bool ModelDownloader::globalInit(std::string& error) {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        error = std::string("curl_global_init failed: ") + curl_easy_strerror(rc);
        return false;
    }
    return true;
}

void ModelDownloader::globalCleanup() {
    curl_global_cleanup();
}

std::string ModelDownloader::urlFor(const std::string& repo, const std::string& file) const {
    return m_endpoint + "/" + repo + "/resolve/main/" + file;
}

bool ModelDownloader::download(const std::string& url, const fs::path& partialPath,
                               const fs::path& destination, ProgressCallback progress) {
    std::error_code ec;
    fs::create_directories(partialPath.parent_path(), ec);
    if (ec) {
        m_lastError = "Cannot create " + partialPath.parent_path().string() + ": " + ec.message();
        return false;
    }
    std::ofstream file(partialPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        m_lastError = "Cannot write " + partialPath.string();
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        m_lastError = "curl_easy_init failed";
        return false;
    }

    TransferState state;
    state.file = &file;
    state.progress = &progress;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "scribed/1.0");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    // Give up on a stalled connection: under 1 byte/s for 60s
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    std::cerr << "[Download] GET " << url << std::endl;
    CURLcode rc = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    file.close();

    if (rc != CURLE_OK || file.fail()) {
        m_lastError = rc != CURLE_OK
            ? std::string(errorBuffer[0] ? errorBuffer : curl_easy_strerror(rc))
            : "Failed writing " + partialPath.string();
        std::cerr << "[Download] " << url << " failed: " << m_lastError << std::endl;
        fs::remove(partialPath, ec);
        return false;
    }

    // The snapshot directory marks a finished download, so it only appears
    // once there is a complete file to put in it
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        m_lastError = "Cannot create " + destination.parent_path().string() + ": " + ec.message();
        fs::remove(partialPath, ec);
        return false;
    }

    fs::rename(partialPath, destination, ec);
    if (ec) {
        m_lastError = "Cannot move download into place: " + ec.message();
        fs::remove(partialPath, ec);
        return false;
    }

    std::cerr << "[Download] Saved " << destination.string() << std::endl;
    return true;
}

} // namespace scribe
