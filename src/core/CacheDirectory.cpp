#include "core/CacheDirectory.hpp"
#include "core/Errors.hpp"
#include <cstdlib>
#include <string>
#include <system_error>

namespace newsfeed {
namespace core {

namespace {

const char* const kApplicationDir = "newsfeed";

} // namespace

std::filesystem::path defaultCacheRoot() {
    // A relative XDG_CACHE_HOME is invalid and ignored
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg && std::filesystem::path(xdg).is_absolute()) {
        return std::filesystem::path(xdg) / kApplicationDir;
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".cache" / kApplicationDir;
    }

    throw ConfigurationError("Cannot determine cache directory: neither XDG_CACHE_HOME nor HOME is set");
}

std::filesystem::path resolveCacheRoot(const std::filesystem::path& configured) {
    if (!configured.empty()) {
        return configured;
    }
    return defaultCacheRoot();
}

void ensureCacheRoot(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw ConfigurationError("Cannot create cache directory " + root.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(root, ec)) {
        throw ConfigurationError("Cache path is not a directory: " + root.string());
    }
}

} // namespace core
} // namespace newsfeed
