#pragma once

#include "../http.hpp"

#include <memory>
#include <string>

namespace api {

// Sets "Authorization: Bearer <token>" on every request before handing it
// to the wrapped transport.
class BearerTransport : public Transport {
public:
    BearerTransport(std::string token, std::shared_ptr<Transport> base);

    std::unique_ptr<Response> RoundTrip(const Request& request) override;

    const std::string& Token() const { return token; }

private:
    std::string token;
    std::shared_ptr<Transport> base;
};

} // namespace api
