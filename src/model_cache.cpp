#include "model_cache.h"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace scribe {

bool isValidIdentifier(const std::string& identifier) {
    if (identifier.empty() || identifier.front() == '/' || identifier.back() == '/') {
        return false;
    }
    if (identifier.find("--") != std::string::npos || identifier.find('\\') != std::string::npos) {
        return false;
    }

    size_t components = 0;
    size_t start = 0;
    while (start <= identifier.size()) {
        size_t end = identifier.find('/', start);
        if (end == std::string::npos) {
            end = identifier.size();
        }
        std::string part = identifier.substr(start, end - start);
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
        ++components;
        start = end + 1;
    }

    return components >= 2;
}

std::string shortName(const std::string& identifier) {
    size_t slash = identifier.find_last_of('/');
    if (slash == std::string::npos) {
        return identifier;
    }
    return identifier.substr(slash + 1);
}

std::string cacheKey(const std::string& identifier) {
    std::string key = "models--";
    for (char c : identifier) {
        if (c == '/') {
            key += "--";
        } else {
            key += c;
        }
    }
    return key;
}

bool hasSnapshot(const fs::path& modelDir) {
    std::error_code ec;
    fs::path snapshots = modelDir / "snapshots";
    if (!fs::is_directory(snapshots, ec) || ec) {
        return false;
    }
    fs::recursive_directory_iterator it(snapshots, ec);
    if (ec) {
        return false;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return false;
        }
        if (it->is_regular_file(ec)) {
            return true;
        }
    }
    return false;
}

ModelCache::ModelCache(fs::path root, CompletenessCheck isComplete)
    : m_root(std::move(root))
    , m_isComplete(std::move(isComplete))
{
}

fs::path ModelCache::modelDir(const std::string& identifier) const {
    return m_root / cacheKey(identifier);
}

bool ModelCache::isCached(const std::string& identifier) const {
    if (!isValidIdentifier(identifier) || !m_isComplete) {
        return false;
    }

    std::error_code ec;
    fs::path dir = modelDir(identifier);
    if (!fs::is_directory(dir, ec) || ec) {
        return false;
    }

    try {
        return m_isComplete(dir);
    } catch (const std::exception& e) {
        std::cerr << "[Models] Cache check failed for " << identifier << ": " << e.what() << std::endl;
        return false;
    }
}

bool ensureDirectory(const fs::path& dir, std::string& error) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        error = "Cannot create directory " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace scribe
