#include "cli.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>

namespace api::cli {

const char* const kUsage =
    "usage: api-client [-X METHOD] [-d BODY] [-H 'Name: value'] [-t SECONDS] <endpoint>\n"
    "\n"
    "Configuration comes from the JSON file named by API_CONFIG, or from\n"
    "API_URL, API_TOKEN, API_REFRESH_TOKEN and API_TOKEN_URL.\n"
    "-t 0 disables the request timeout.\n";

namespace {

std::chrono::milliseconds parse_timeout(const std::string& value) {
    errno = 0;
    char* end = nullptr;
    long seconds = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE) {
        throw UsageError("-t expects a whole number of seconds, got '" + value + "'");
    }
    if (seconds < 0) {
        throw UsageError("-t must not be negative");
    }
    return std::chrono::seconds(seconds);
}

} // namespace

Arguments parse_args(const std::vector<std::string>& args) {
    Arguments out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();
        if ((arg == "-X" || arg == "-d" || arg == "-H" || arg == "-t") && !has_value) {
            throw UsageError(arg + " needs a value");
        }

        if (arg == "-X") {
            out.method = args[++i];
        } else if (arg == "-d") {
            out.body = args[++i];
        } else if (arg == "-H") {
            const std::string& header = args[++i];
            auto pos = header.find(':');
            if (pos == std::string::npos || trim(header.substr(0, pos)).empty()) {
                throw UsageError("-H expects 'Name: value', got '" + header + "'");
            }
            out.headers.Set(trim(header.substr(0, pos)), trim(header.substr(pos + 1)));
        } else if (arg == "-t") {
            out.options.timeout = parse_timeout(args[++i]);
        } else if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (!arg.empty() && arg[0] != '-' && out.endpoint.empty()) {
            out.endpoint = arg;
        } else {
            throw UsageError("unexpected argument '" + arg + "'");
        }
    }
    if (out.endpoint.empty() && !out.help) {
        throw UsageError("missing endpoint");
    }
    return out;
}

Request build_request(const Arguments& args, const std::string& url) {
    Request request = make_request(args.method, url, args.body);
    request.headers = args.headers;
    if (!args.body.empty() && !request.headers.Has("Content-Type")) {
        request.headers.Set("Content-Type", "application/json");
    }
    return request;
}

int exit_code(const Result& result) {
    if (!result.ok() || !result.response) return kExitRequestError;
    return is_success_status(result.response->status) ? kExitOk : kExitHttpError;
}

} // namespace api::cli
