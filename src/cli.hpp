#pragma once

#include "api/client.hpp"
#include "http.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace api::cli {

enum ExitCode {
    kExitOk = 0,
    kExitHttpError = 1,
    kExitUsage = 2,
    kExitRequestError = 3,
};

// Bad command line. The message is meant for stderr, followed by the usage.
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Arguments {
    std::string method = "GET";
    std::string body;
    Headers headers;
    ClientOptions options;
    std::string endpoint;
    bool help = false;
};

extern const char* const kUsage;

// Parses argv without the program name. Throws UsageError.
Arguments parse_args(const std::vector<std::string>& args);

// The request the CLI sends for `args` once the endpoint resolved to `url`.
Request build_request(const Arguments& args, const std::string& url);

// 0 for a 2xx response, 1 for any other status, 3 when the call failed.
int exit_code(const Result& result);

} // namespace api::cli
