#include "core/HttpClient.hpp"
#include <cpr/cpr.h>

namespace newsfeed {
namespace core {

CprHttpClient::CprHttpClient(std::chrono::milliseconds timeout, const std::string& userAgent)
    : timeout_(timeout), userAgent_(userAgent) {}

HttpResponse CprHttpClient::get(const std::string& url, const std::string& accept) {
    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", userAgent_},
            {"Accept", accept}
        },
        cpr::Timeout{timeout_},
        cpr::Redirect{50L},
        cpr::VerifySsl{true}
    );

    HttpResponse result;
    result.statusCode = response.status_code;
    result.body = std::move(response.text);
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "transport error" : response.error.message;
    }
    return result;
}

} // namespace core
} // namespace newsfeed
