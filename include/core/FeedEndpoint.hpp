#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace newsfeed {
namespace core {

struct FeedEndpoint {
    std::string url;
    std::string name;
    bool enabled;

    FeedEndpoint() : enabled(true) {}

    FeedEndpoint(const std::string& url, const std::string& name = "", bool enabled = true)
        : url(url), name(name), enabled(enabled) {}

    // Name if one was given, otherwise the URL
    const std::string& label() const {
        return name.empty() ? url : name;
    }

    // JSON serialization
    nlohmann::json toJson() const {
        return nlohmann::json{
            {"url", url},
            {"name", name},
            {"enabled", enabled}
        };
    }

    // JSON deserialization; name and enabled are optional
    static FeedEndpoint fromJson(const nlohmann::json& j) {
        FeedEndpoint endpoint;
        endpoint.url = j.at("url").get<std::string>();
        endpoint.name = j.value("name", std::string());
        endpoint.enabled = j.value("enabled", true);
        return endpoint;
    }

    bool operator==(const FeedEndpoint& other) const {
        return url == other.url;
    }
};

} // namespace core
} // namespace newsfeed
