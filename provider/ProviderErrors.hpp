#pragma once

#include <stdexcept>
#include <string>

namespace tripseg::provider {

enum class ErrorKind {
    AuthFailure,
    RateLimited,
    TokenExpired,
    BadParameters,
    Generic,
    Timeout,
    Transport
};

// Base for every failure surfaced by the provider client. code is the provider status, or -1.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ErrorKind kind, int code, const std::string& message)
        : std::runtime_error(message), kind_(kind), code_(code) {}

    ErrorKind kind() const noexcept { return kind_; }
    int code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    int code_;
};

class AuthFailure : public ProviderError {
public:
    AuthFailure(int code, const std::string& cause)
        : ProviderError(ErrorKind::AuthFailure, code, "Provider login failed (" + std::to_string(code) + "): " + cause) {}
};

class ProviderRateLimited : public ProviderError {
public:
    ProviderRateLimited(int code, int attempts)
        : ProviderError(ErrorKind::RateLimited, code,
                        "Provider rate limit persisted after " + std::to_string(attempts) + " attempts") {}
};

class ProviderTokenExpired : public ProviderError {
public:
    explicit ProviderTokenExpired(int code)
        : ProviderError(ErrorKind::TokenExpired, code, "Provider token expired again after re-login") {}
};

class ProviderBadParameters : public ProviderError {
public:
    ProviderBadParameters(int code, const std::string& cause)
        : ProviderError(ErrorKind::BadParameters, code, "Provider rejected parameters: " + cause) {}
};

class ProviderGenericError : public ProviderError {
public:
    ProviderGenericError(int code, const std::string& cause)
        : ProviderError(ErrorKind::Generic, code, "Provider error " + std::to_string(code) + ": " + cause) {}
};

class ProviderTimeout : public ProviderError {
public:
    explicit ProviderTimeout(const std::string& what)
        : ProviderError(ErrorKind::Timeout, -1, "Deadline exceeded: " + what) {}
};

class ProviderTransportError : public ProviderError {
public:
    explicit ProviderTransportError(const std::string& cause)
        : ProviderError(ErrorKind::Transport, -1, "Provider unreachable: " + cause) {}
};

std::string errorKindToString(ErrorKind kind);

} // namespace tripseg::provider
