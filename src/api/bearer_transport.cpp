#include "bearer_transport.hpp"

namespace api {

BearerTransport::BearerTransport(std::string token, std::shared_ptr<Transport> base)
    : token(std::move(token)), base(std::move(base)) {}

std::unique_ptr<Response> BearerTransport::RoundTrip(const Request& request) {
    Request authorized = request;
    authorized.headers.Set("Authorization", "Bearer " + token);
    return base->RoundTrip(authorized);
}

} // namespace api
