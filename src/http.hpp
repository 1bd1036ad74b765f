#pragma once

#include "api/context.hpp"
#include "api/error.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace api {

// Header fields keyed by lower-cased name. Repeated fields are folded into
// one comma-separated value.
class Headers {
public:
    using Map = std::map<std::string, std::string>;

    void Set(const std::string& name, const std::string& value);
    void Add(const std::string& name, const std::string& value);
    std::optional<std::string> Get(const std::string& name) const;
    bool Has(const std::string& name) const;

    bool empty() const { return fields.empty(); }
    std::size_t size() const { return fields.size(); }
    Map::const_iterator begin() const { return fields.begin(); }
    Map::const_iterator end() const { return fields.end(); }

private:
    Map fields;
};

struct Request {
    std::string method = "GET";
    std::string url;
    Headers headers;
    std::string body;

    // Observed by the transport for cancellation and deadlines. Null means
    // the request is not bound to any context.
    ContextPtr context;

    // Copy of this request bound to `ctx`.
    Request WithContext(ContextPtr ctx) const;
};

Request make_request(const std::string& method, const std::string& url, const std::string& body = "");
Request make_get(const std::string& url);
Request make_post_json(const std::string& url, const std::string& body);

// Streaming response body.
class Body {
public:
    virtual ~Body() = default;

    // Reads up to `size` bytes into `buffer`. Returns 0 at end of stream.
    // Throws api::Error on failure.
    virtual std::size_t Read(char* buffer, std::size_t size) = 0;

    // Releases the underlying stream. Idempotent; throws api::Error if the
    // stream could not be released cleanly.
    virtual void Close() = 0;
};

// Body over bytes already in memory.
class StringBody : public Body {
public:
    explicit StringBody(std::string data);

    std::size_t Read(char* buffer, std::size_t size) override;
    void Close() override;

private:
    std::string data;
    std::size_t offset = 0;
    bool closed = false;
};

struct Response {
    long status = 0;
    std::string status_text;
    Headers headers;
    std::unique_ptr<Body> body;
};

// Executes one HTTP exchange. Implementations must be safe for concurrent
// use and must honour the request context.
class Transport {
public:
    virtual ~Transport() = default;

    // Returns once the response headers have been received; the body streams
    // through Response::body. Throws api::Error (Transport or Cancellation)
    // when no response could be obtained.
    virtual std::unique_ptr<Response> RoundTrip(const Request& request) = 0;
};

// Closes a response body exactly once: explicitly through Close(), or on
// scope exit, where a failure can only be logged.
class BodyCloser {
public:
    explicit BodyCloser(Body& body) : body(body) {}
    ~BodyCloser();

    BodyCloser(const BodyCloser&) = delete;
    BodyCloser& operator=(const BodyCloser&) = delete;

    std::optional<Error> Close();

private:
    Body& body;
    bool closed = false;
};

// Drains `body` into a byte string.
std::string read_all(Body& body);

bool is_success_status(long status);

} // namespace api
