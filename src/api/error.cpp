#include "error.hpp"

namespace api {

namespace {
class ContextCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "context"; }

    std::string message(int ev) const override {
        switch (static_cast<context_errc>(ev)) {
        case context_errc::canceled:
            return "context canceled";
        case context_errc::deadline_exceeded:
            return "context deadline exceeded";
        }
        return "unknown context error";
    }
};
} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Cancellation: return "cancellation";
    case ErrorKind::Read: return "read";
    }
    return "unknown";
}

const std::error_category& context_category() noexcept {
    static const ContextCategory category;
    return category;
}

std::error_code make_error_code(context_errc e) noexcept {
    return {static_cast<int>(e), context_category()};
}

Error::Error(ErrorKind kind, std::error_code code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(code) {}

Error::Error(ErrorKind kind, std::error_code code)
    : Error(kind, code, code.message()) {}

ConfigurationError::ConfigurationError(const std::string& message, std::error_code code)
    : Error(ErrorKind::Configuration, code, message) {}

Error cancellation_error(std::error_code reason) {
    return Error(ErrorKind::Cancellation, reason);
}

} // namespace api
