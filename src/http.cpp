#include "http.hpp"
#include "api/error.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstring>

namespace api {

void Headers::Set(const std::string& name, const std::string& value) {
    fields[to_lower(name)] = value;
}

void Headers::Add(const std::string& name, const std::string& value) {
    auto& field = fields[to_lower(name)];
    if (!field.empty()) {
        field += ", ";
    }
    field += value;
}

std::optional<std::string> Headers::Get(const std::string& name) const {
    auto it = fields.find(to_lower(name));
    if (it == fields.end()) return std::nullopt;
    return it->second;
}

bool Headers::Has(const std::string& name) const {
    return fields.count(to_lower(name)) != 0;
}

Request Request::WithContext(ContextPtr ctx) const {
    Request copy = *this;
    copy.context = std::move(ctx);
    return copy;
}

Request make_request(const std::string& method, const std::string& url, const std::string& body) {
    Request req;
    req.method = method;
    req.url = url;
    req.body = body;
    return req;
}

Request make_get(const std::string& url) {
    return make_request("GET", url);
}

Request make_post_json(const std::string& url, const std::string& body) {
    Request req = make_request("POST", url, body);
    req.headers.Set("Content-Type", "application/json");
    return req;
}

StringBody::StringBody(std::string data) : data(std::move(data)) {}

std::size_t StringBody::Read(char* buffer, std::size_t size) {
    if (closed) {
        throw Error(ErrorKind::Read, std::make_error_code(std::errc::bad_file_descriptor),
                    "read on closed body");
    }
    std::size_t n = std::min(size, data.size() - offset);
    std::memcpy(buffer, data.data() + offset, n);
    offset += n;
    return n;
}

void StringBody::Close() {
    closed = true;
}

BodyCloser::~BodyCloser() {
    if (closed) return;
    if (auto err = Close()) {
        API_LOG_WARN("closing response body: {}", err->what());
    }
}

std::optional<Error> BodyCloser::Close() {
    closed = true;
    try {
        body.Close();
    } catch (const Error& e) {
        return e;
    }
    return std::nullopt;
}

std::string read_all(Body& body) {
    std::string out;
    char buffer[16 * 1024];
    for (;;) {
        std::size_t n = body.Read(buffer, sizeof(buffer));
        if (n == 0) break;
        out.append(buffer, n);
    }
    return out;
}

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

} // namespace api
