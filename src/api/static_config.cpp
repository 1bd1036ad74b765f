#include "static_config.hpp"
#include "bearer_transport.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace api {

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw ConfigurationError(std::string("config field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string join_url(const std::string& base, const std::string& path) {
    if (!path.empty() && path.front() == '/') return base + path;
    return base + "/" + path;
}

} // namespace

StaticConfig StaticConfig::FromEnv() {
    StaticConfig cfg;
    cfg.base_url = get_env("API_URL", "");
    cfg.access_token = get_env("API_TOKEN", "");
    cfg.refresh_token = get_env("API_REFRESH_TOKEN", "");
    cfg.token_url = get_env("API_TOKEN_URL", "");
    return cfg;
}

StaticConfig StaticConfig::FromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open config file " + path,
                                 std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::ostringstream text;
    text << in.rdbuf();
    return FromJson(text.str());
}

StaticConfig StaticConfig::FromJson(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ConfigurationError("config is not a JSON object");
    }

    StaticConfig cfg;
    cfg.base_url = string_field(j, "base_url");
    cfg.access_token = string_field(j, "access_token");
    cfg.refresh_token = string_field(j, "refresh_token");
    cfg.token_url = string_field(j, "token_url");

    auto eps = j.find("endpoints");
    if (eps != j.end() && !eps->is_null()) {
        if (!eps->is_object()) {
            throw ConfigurationError("config field 'endpoints' must be an object");
        }
        for (auto it = eps->begin(); it != eps->end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigurationError("endpoint '" + it.key() + "' must be a string");
            }
            cfg.endpoints[it.key()] = it.value().get<std::string>();
        }
    }
    return cfg;
}

EndpointResolver StaticConfig::Endpoints() const {
    const std::string base = trim_right_slash(base_url);
    if (!base.empty() && !is_http_url(base)) {
        throw ConfigurationError("base_url is not an http(s) URL: " + base_url);
    }

    std::map<std::string, std::string> resolved;
    for (const auto& entry : endpoints) {
        const std::string& target = entry.second;
        if (is_http_url(target)) {
            resolved[entry.first] = target;
        } else if (base.empty()) {
            throw ConfigurationError("endpoint '" + entry.first + "' is relative and base_url is not set");
        } else {
            resolved[entry.first] = join_url(base, target);
        }
    }

    return [base, resolved](const std::string& name) -> std::optional<std::string> {
        auto it = resolved.find(name);
        if (it != resolved.end()) return it->second;
        if (base.empty() || name.empty()) return std::nullopt;
        return join_url(base, name);
    };
}

std::shared_ptr<Transport> StaticConfig::Authorize(const ContextPtr& ctx,
                                                   std::shared_ptr<Transport> transport) const {
    if (!access_token.empty()) {
        return std::make_shared<BearerTransport>(access_token, std::move(transport));
    }
    if (!refresh_token.empty()) {
        std::string token = exchange_refresh_token(ctx, *transport);
        return std::make_shared<BearerTransport>(token, std::move(transport));
    }
    return transport;
}

std::string StaticConfig::exchange_refresh_token(const ContextPtr& ctx, Transport& transport) const {
    if (!is_http_url(token_url)) {
        throw ConfigurationError("refresh_token requires an http(s) token_url");
    }

    nlohmann::json body;
    body["refresh_token"] = refresh_token;

    Request req = make_post_json(token_url, body.dump()).WithContext(ctx);
    std::unique_ptr<Response> resp;
    std::string text;
    try {
        resp = transport.RoundTrip(req);
        if (!resp) {
            throw Error(ErrorKind::Transport, std::make_error_code(std::errc::protocol_error),
                        "transport returned no response");
        }
        if (resp->body) {
            BodyCloser closer(*resp->body);
            text = read_all(*resp->body);
            if (auto err = closer.Close()) throw *err;
        }
    } catch (const Error& e) {
        throw ConfigurationError(std::string("token refresh failed: ") + e.what(), e.code());
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("token refresh failed: ") + e.what(),
                                 std::make_error_code(std::errc::io_error));
    }

    if (resp->status != 200) {
        throw ConfigurationError("token refresh failed: status " + std::to_string(resp->status),
                                 std::make_error_code(std::errc::permission_denied));
    }

    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ConfigurationError("token refresh failed: response is not a JSON object");
    }

    std::string access = string_field(j, "access_token");
    if (access.empty()) {
        throw ConfigurationError("token refresh failed: no access_token in response");
    }
    API_LOG_DEBUG("exchanged refresh token at {}", token_url);
    return access;
}

} // namespace api
