#pragma once

#include "../http.hpp"
#include "context.hpp"
#include "error.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace api {

// Maps an endpoint name to its URL; empty when the name is unknown.
using EndpointResolver = std::function<std::optional<std::string>(const std::string&)>;

// Supplies what a Client needs: where the endpoints live and how requests
// are authorized.
class Config {
public:
    virtual ~Config() = default;

    // Resolver for the location of named endpoints. Throws
    // ConfigurationError if the endpoints cannot be determined.
    virtual EndpointResolver Endpoints() const = 0;

    // Transport applying the authorization defined by this configuration.
    // `ctx` governs any requests needed to obtain credentials. Without
    // authorization details `transport` may be returned as is. Throws
    // ConfigurationError on failure.
    virtual std::shared_ptr<Transport> Authorize(const ContextPtr& ctx,
                                                 std::shared_ptr<Transport> transport) const = 0;
};

struct ClientOptions {
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

    // Upper bound on a whole call, headers and body included. Applied on top
    // of the caller's context; whichever expires first wins. Zero disables it.
    std::chrono::milliseconds timeout = kDefaultTimeout;
};

// Outcome of Client::Do. `response` is null when the round trip failed;
// when `error` is set the body must not be relied on.
struct Result {
    std::unique_ptr<Response> response;
    std::string body;
    std::optional<Error> error;

    bool ok() const { return !error; }
};

// Issues requests against an API server. Immutable after construction and
// safe for concurrent use.
class Client {
public:
    Client(std::shared_ptr<Transport> transport, EndpointResolver endpoints, ClientOptions options);

    std::optional<std::string> URL(const std::string& endpoint) const;

    // Performs `request` and reads the whole response body. A null `ctx`
    // leaves only the client timeout in force. The body is closed and the
    // reader thread joined before this returns.
    Result Do(const ContextPtr& ctx, const Request& request) const;

    std::chrono::milliseconds Timeout() const { return options.timeout; }

private:
    const std::shared_ptr<Transport> transport;
    const EndpointResolver endpoints;
    const ClientOptions options;
};

// Builds a client from `config`. `ctx` is used for authorization requests;
// a null `transport` selects the default CurlTransport. Exceptions thrown by
// the configuration propagate unchanged and no client is created.
std::shared_ptr<Client> NewClient(const ContextPtr& ctx,
                                  const Config& config,
                                  std::shared_ptr<Transport> transport = nullptr,
                                  ClientOptions options = {});

} // namespace api
