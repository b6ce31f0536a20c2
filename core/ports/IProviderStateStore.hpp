#pragma once

#include "../IClock.hpp"
#include <optional>
#include <string>

namespace tripseg::ports {

struct ProviderSession {
    std::string token;
    Timestamp expiresAt;
    std::string serverId;
};

// Shared provider state that must survive restarts and be visible to sibling workers.
class IProviderStateStore {
public:
    virtual ~IProviderStateStore() = default;
    
    virtual std::optional<ProviderSession> loadSession() = 0;
    virtual void saveSession(const ProviderSession& session) = 0;
    virtual void clearSession() = 0;
    
    virtual std::optional<Timestamp> loadBackoffUntil() = 0;
    virtual void saveBackoffUntil(Timestamp until) = 0;
};

} // namespace tripseg::ports
