#include "TokenManager.hpp"
#include <iostream>

namespace tripseg::provider {

TokenManager::TokenManager(std::shared_ptr<IClock> clock,
                           LoginFunction login,
                           TokenPolicy policy,
                           std::shared_ptr<ports::IProviderStateStore> stateStore)
    : clock_(clock), login_(std::move(login)), policy_(policy), stateStore_(stateStore) {
}

ports::ProviderSession TokenManager::acquireToken() {
    std::promise<ports::ProviderSession> promise;
    std::shared_future<ports::ProviderSession> pending;
    bool leader = false;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (!session_ && !loadedFromStore_ && stateStore_) {
            session_ = stateStore_->loadSession();
            loadedFromStore_ = true;
        }
        
        if (session_ && isFresh(*session_, clock_->now())) {
            return *session_;
        }
        
        if (inFlight_.valid()) {
            pending = inFlight_;
        } else {
            pending = promise.get_future().share();
            inFlight_ = pending;
            leader = true;
        }
    }
    
    if (!leader) {
        return pending.get();
    }
    
    try {
        std::cout << "[TokenManager] Requesting new provider session" << std::endl;
        ports::ProviderSession session = login_();
        session.expiresAt = clock_->now() + policy_.tokenValidity;
        
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_ = session;
            inFlight_ = {};
            ++loginCount_;
        }
        
        if (stateStore_) {
            stateStore_->saveSession(session);
        }
        
        std::cout << "[TokenManager] Session valid until " << formatIso8601(session.expiresAt) << std::endl;
        promise.set_value(session);
    } catch (...) {
        // Waiters receive the same failure; the next caller starts a fresh login
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_ = {};
            ++loginCount_;
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    
    return pending.get();
}

void TokenManager::invalidate(const std::string& token) {
    bool cleared = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->token == token) {
            session_.reset();
            loadedFromStore_ = true;
            cleared = true;
        }
    }
    
    if (cleared) {
        std::cout << "[TokenManager] Session invalidated" << std::endl;
        if (stateStore_) {
            stateStore_->clearSession();
        }
    }
}

std::optional<ports::ProviderSession> TokenManager::cachedSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

int TokenManager::loginCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loginCount_;
}

bool TokenManager::isFresh(const ports::ProviderSession& session, Timestamp now) const {
    return !session.token.empty() && now < session.expiresAt - policy_.refreshBuffer;
}

} // namespace tripseg::provider
