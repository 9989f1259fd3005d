#pragma once

#include <filesystem>

namespace newsfeed {
namespace core {

// $XDG_CACHE_HOME/newsfeed, or $HOME/.cache/newsfeed. Throws
// ConfigurationError when neither variable is usable.
std::filesystem::path defaultCacheRoot();

// The configured root if one was given, otherwise defaultCacheRoot().
std::filesystem::path resolveCacheRoot(const std::filesystem::path& configured);

// Create the directory if needed. Throws ConfigurationError if it cannot be
// created or exists as something other than a directory.
void ensureCacheRoot(const std::filesystem::path& root);

} // namespace core
} // namespace newsfeed
