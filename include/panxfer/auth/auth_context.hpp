#pragma once

#include <mutex>
#include <string>

namespace panxfer::auth {

/**
 * @brief Credential values captured by one operation at call start
 */
struct Credentials {
    std::string token;      ///< Full authorization header value, empty when signed out
    std::string client_id;  ///< Stable per-process identifier
};

/**
 * @brief Process-wide credential cell shared by all transfers
 *
 * The token is guarded for read/replace only. Operations take a
 * snapshot() when they start and keep using it, so replacing or
 * clearing the token never affects a transfer already in flight.
 */
class AuthContext {
public:
    AuthContext();
    explicit AuthContext(std::string client_id);

    AuthContext(const AuthContext&) = delete;
    AuthContext& operator=(const AuthContext&) = delete;

    [[nodiscard]] std::string current_credential() const;
    [[nodiscard]] const std::string& client_identifier() const noexcept { return client_id_; }
    [[nodiscard]] Credentials snapshot() const;

    void set_credential(std::string token);
    void clear();

    /// 32 lowercase hex characters, random per call
    static std::string generate_client_id();

private:
    const std::string client_id_;
    mutable std::mutex mutex_;
    std::string token_;
};

} // namespace panxfer::auth
