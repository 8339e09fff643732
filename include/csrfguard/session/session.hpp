#pragma once

#include <string>
#include <optional>
#include <unordered_map>
#include <memory>
#include <mutex>

namespace csrfguard {
namespace session {

/**
 * @brief Key/value storage scoped to one client session
 *
 * Implementations must make set_if_absent atomic so concurrent requests of
 * the same session agree on a single value.
 */
class Session {
public:
    virtual ~Session() = default;

    virtual std::string id() const = 0;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual bool contains(const std::string& key) const = 0;
    virtual bool erase(const std::string& key) = 0;

    /**
     * @brief Store value unless key is already set
     * @return The value held for key after the call
     */
    virtual std::string set_if_absent(const std::string& key, const std::string& value) = 0;
};

/**
 * @brief Mutex-protected in-memory session
 */
class InMemorySession : public Session {
private:
    std::string id_;
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;

public:
    explicit InMemorySession(std::string id = "");

    std::string id() const override { return id_; }

    std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    bool contains(const std::string& key) const override;
    bool erase(const std::string& key) override;
    std::string set_if_absent(const std::string& key, const std::string& value) override;

    size_t size() const;
};

/**
 * @brief Session lookup by id
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Pass an empty id to start a new session
    virtual std::shared_ptr<Session> get_or_create(const std::string& session_id) = 0;
    virtual std::shared_ptr<Session> find(const std::string& session_id) const = 0;
    virtual bool remove(const std::string& session_id) = 0;
    virtual size_t size() const = 0;
};

/**
 * @brief Process-local session store with CSPRNG session ids
 */
class InMemorySessionStore : public SessionStore {
private:
    std::unordered_map<std::string, std::shared_ptr<InMemorySession>> sessions_;
    mutable std::mutex mutex_;

public:
    std::shared_ptr<Session> get_or_create(const std::string& session_id) override;
    std::shared_ptr<Session> find(const std::string& session_id) const override;
    bool remove(const std::string& session_id) override;
    size_t size() const override;

    /**
     * @brief New random session id (32 hex characters)
     * @throws RandomSourceException if the CSPRNG fails
     */
    static std::string generate_session_id();
};

} // namespace session
} // namespace csrfguard
