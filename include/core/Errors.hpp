#pragma once

#include <stdexcept>
#include <string>

namespace newsfeed {
namespace core {

// Base for every error raised by the ingestion pipeline.
class NewsError : public std::runtime_error {
public:
    explicit NewsError(const std::string& msg) : std::runtime_error(msg) {}
};

// Cache root or configuration file unusable. Fatal for the run.
class ConfigurationError : public NewsError {
public:
    explicit ConfigurationError(const std::string& msg) : NewsError(msg) {}
};

// One feed endpoint could not be fetched or parsed.
class FeedFetchError : public NewsError {
public:
    FeedFetchError(const std::string& url, const std::string& msg)
        : NewsError(msg), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// An entry has no title or no description, so no digest can be computed.
class MissingContentError : public NewsError {
public:
    explicit MissingContentError(const std::string& msg) : NewsError(msg) {}
};

// One image could not be downloaded, decoded or written.
class ImageFetchError : public NewsError {
public:
    ImageFetchError(const std::string& url, const std::string& msg)
        : NewsError(msg), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// The durable item store is corrupt, unreadable or unwritable. Fatal for the run.
class StoreError : public NewsError {
public:
    explicit StoreError(const std::string& msg) : NewsError(msg) {}
};

} // namespace core
} // namespace newsfeed
