#include "csrfguard/session/session.hpp"
#include "csrfguard/security/crypto.hpp"

namespace csrfguard {
namespace session {

// InMemorySession implementation
InMemorySession::InMemorySession(std::string id)
    : id_(std::move(id)) {
}

std::optional<std::string> InMemorySession::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = values_.find(key);
    return (it != values_.end()) ? std::make_optional(it->second) : std::nullopt;
}

void InMemorySession::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

bool InMemorySession::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

bool InMemorySession::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

std::string InMemorySession::set_if_absent(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = values_.emplace(key, value);
    return result.first->second;
}

size_t InMemorySession::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

// InMemorySessionStore implementation
std::shared_ptr<Session> InMemorySessionStore::get_or_create(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!session_id.empty()) {
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            return it->second;
        }
    }

    std::string id = session_id.empty() ? generate_session_id() : session_id;
    auto session = std::make_shared<InMemorySession>(id);
    sessions_[id] = session;
    return session;
}

std::shared_ptr<Session> InMemorySessionStore::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    return (it != sessions_.end()) ? it->second : nullptr;
}

bool InMemorySessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::string InMemorySessionStore::generate_session_id() {
    auto bytes = security::crypto::random_bytes(16);
    return security::crypto::to_hex(bytes.data(), bytes.size());
}

} // namespace session
} // namespace csrfguard
