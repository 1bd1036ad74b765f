#pragma once

#include "client.hpp"

#include <map>
#include <memory>
#include <string>

namespace api {

// Configuration with fixed endpoints and optional bearer credentials.
//
// Endpoint entries are absolute URLs or paths relative to base_url. Names
// without an entry resolve to base_url + "/" + name.
//
// Authorization, first match wins:
//   access_token             requests carry it as a bearer token
//   refresh_token, token_url the refresh token is exchanged for an access
//                            token at token_url when the client is built
//   neither                  requests are sent anonymously
class StaticConfig : public Config {
public:
    std::string base_url;
    std::map<std::string, std::string> endpoints;
    std::string access_token;
    std::string refresh_token;
    std::string token_url;

    // API_URL, API_TOKEN, API_REFRESH_TOKEN, API_TOKEN_URL.
    static StaticConfig FromEnv();

    // JSON object with the same field names; "endpoints" is an object of
    // strings. Throws ConfigurationError on unreadable or malformed input.
    static StaticConfig FromFile(const std::string& path);
    static StaticConfig FromJson(const std::string& text);

    EndpointResolver Endpoints() const override;
    std::shared_ptr<Transport> Authorize(const ContextPtr& ctx,
                                         std::shared_ptr<Transport> transport) const override;

private:
    std::string exchange_refresh_token(const ContextPtr& ctx, Transport& transport) const;
};

} // namespace api
