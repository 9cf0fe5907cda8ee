#pragma once

#include <stdexcept>
#include <string>

namespace lb {

// Bad invocation or settings; surfaced before any upload starts.
struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DirectoryNotFound : ConfigurationError {
    using ConfigurationError::ConfigurationError;
};

struct AuthError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Remote API rejected a call. code is the service's error code, -1 for transport or parse failures.
struct ApiError : std::runtime_error {
    int code;

    ApiError(const int code, const std::string& msg) : std::runtime_error(msg), code(code) {}
};

struct UploadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
