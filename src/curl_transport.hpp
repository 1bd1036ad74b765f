#pragma once

#include "http.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <system_error>

namespace api {

// Error category wrapping libcurl's CURLcode values.
const std::error_category& curl_category() noexcept;
std::error_code make_curl_error(int code) noexcept;

// Default transport: one libcurl transfer per round trip, driven by a
// worker thread so the body can stream after the headers have arrived.
// Redirects are not followed.
class CurlTransport : public Transport {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{5000};
        std::string user_agent = "api-client/0.1";
    };

    CurlTransport();
    explicit CurlTransport(Options options);

    std::unique_ptr<Response> RoundTrip(const Request& request) override;

private:
    Options options;
};

} // namespace api
