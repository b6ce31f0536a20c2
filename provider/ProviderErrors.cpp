#include "ProviderErrors.hpp"

namespace tripseg::provider {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthFailure: return "auth_failure";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::TokenExpired: return "token_expired";
        case ErrorKind::BadParameters: return "bad_parameters";
        case ErrorKind::Generic: return "generic";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Transport: return "transport";
    }
    return "generic";
}

} // namespace tripseg::provider
