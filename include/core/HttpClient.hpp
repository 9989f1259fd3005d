#pragma once

#include <chrono>
#include <string>

namespace newsfeed {
namespace core {

struct HttpResponse {
    long statusCode = 0;
    std::string body;
    std::string error;  // Transport error, empty when a response arrived

    bool ok() const { return error.empty() && statusCode >= 200 && statusCode < 300; }
};

// Blocking GET. Implementations must be callable from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const std::string& accept) = 0;
};

class CprHttpClient : public HttpClient {
public:
    CprHttpClient(std::chrono::milliseconds timeout, const std::string& userAgent);

    HttpResponse get(const std::string& url, const std::string& accept) override;

private:
    std::chrono::milliseconds timeout_;
    std::string userAgent_;
};

} // namespace core
} // namespace newsfeed
