#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace api {

// Which stage of a client operation failed.
enum class ErrorKind {
    Configuration, // authorization or endpoint setup at construction
    Transport,     // round trip failed before a response was obtained
    Cancellation,  // the context was cancelled or its deadline passed
    Read           // reading or closing the response body failed
};

const char* to_string(ErrorKind kind);

enum class context_errc {
    canceled = 1,
    deadline_exceeded
};

const std::error_category& context_category() noexcept;
std::error_code make_error_code(context_errc e) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::error_code code, const std::string& message);
    Error(ErrorKind kind, std::error_code code);

    ErrorKind kind() const noexcept { return kind_; }
    const std::error_code& code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    std::error_code code_;
};

// Thrown by Config implementations when authorization or endpoint
// resolution cannot be set up.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message,
                                std::error_code code = std::make_error_code(std::errc::invalid_argument));
};

// Cancellation error for a context that has finished with `reason`.
Error cancellation_error(std::error_code reason);

} // namespace api

namespace std {
template <>
struct is_error_code_enum<api::context_errc> : true_type {};
} // namespace std
