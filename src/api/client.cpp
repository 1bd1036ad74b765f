#include "client.hpp"
#include "read_task.hpp"
#include "../curl_transport.hpp"
#include "../log.hpp"

namespace api {

Client::Client(std::shared_ptr<Transport> transport, EndpointResolver endpoints, ClientOptions options)
    : transport(std::move(transport)), endpoints(std::move(endpoints)), options(options) {}

std::optional<std::string> Client::URL(const std::string& endpoint) const {
    return endpoints(endpoint);
}

Result Client::Do(const ContextPtr& ctx, const Request& request) const {
    ContextPtr parent = ctx ? ctx : Context::Background();
    auto scoped = options.timeout.count() > 0 ? Context::WithTimeout(parent, options.timeout)
                                              : Context::WithCancel(parent);
    ContextPtr call_ctx = scoped.first;
    struct CancelOnExit {
        CancelFunc cancel;
        ~CancelOnExit() { cancel(); }
    } cancel_on_exit{scoped.second};

    Request bound = request.WithContext(call_ctx);
    API_LOG_DEBUG("{} {}", bound.method, bound.url);

    Result result;
    try {
        result.response = transport->RoundTrip(bound);
    } catch (const Error& e) {
        API_LOG_DEBUG("{} {}: {} error: {}", bound.method, bound.url, to_string(e.kind()), e.what());
        result.error = e;
        return result;
    } catch (const std::exception& e) {
        API_LOG_DEBUG("{} {}: {}", bound.method, bound.url, e.what());
        result.error = Error(ErrorKind::Transport, std::make_error_code(std::errc::io_error), e.what());
        return result;
    }
    if (!result.response) {
        result.error = Error(ErrorKind::Transport, std::make_error_code(std::errc::protocol_error),
                             "transport returned no response");
        return result;
    }

    if (!result.response->body) {
        result.response->body = std::make_unique<StringBody>("");
    }

    BodyCloser closer(*result.response->body);
    ReadTask reader(*result.response->body);

    if (reader.Wait(*call_ctx)) {
        reader.Join();
        result.body = reader.TakeBody();
        result.error = reader.TakeError();
    } else {
        // The reader still owns the body; let it finish before closing.
        reader.Join();
        result.error = closer.Close();
        if (!result.error) {
            result.error = cancellation_error(call_ctx->Err());
        }
    }

    API_LOG_DEBUG("{} {}: status {}, {} bytes{}", bound.method, bound.url, result.response->status,
                  result.body.size(), result.error ? std::string(", ") + result.error->what() : "");
    return result;
}

std::shared_ptr<Client> NewClient(const ContextPtr& ctx,
                                  const Config& config,
                                  std::shared_ptr<Transport> transport,
                                  ClientOptions options) {
    if (!transport) {
        transport = std::make_shared<CurlTransport>();
    }

    auto authorized = config.Authorize(ctx ? ctx : Context::Background(), std::move(transport));
    if (!authorized) {
        throw ConfigurationError("authorization produced no transport");
    }

    auto endpoints = config.Endpoints();
    if (!endpoints) {
        throw ConfigurationError("configuration produced no endpoint resolver");
    }

    API_LOG_DEBUG("api client ready, timeout {} ms", options.timeout.count());
    return std::make_shared<Client>(std::move(authorized), std::move(endpoints), options);
}

} // namespace api
