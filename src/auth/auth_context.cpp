#include "panxfer/auth/auth_context.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace panxfer::auth {

AuthContext::AuthContext() : AuthContext(generate_client_id()) {}

AuthContext::AuthContext(std::string client_id) : client_id_(std::move(client_id)) {}

std::string AuthContext::current_credential() const {
    std::lock_guard lock(mutex_);
    return token_;
}

Credentials AuthContext::snapshot() const {
    std::lock_guard lock(mutex_);
    return Credentials{token_, client_id_};
}

void AuthContext::set_credential(std::string token) {
    std::lock_guard lock(mutex_);
    token_ = std::move(token);
}

void AuthContext::clear() {
    std::lock_guard lock(mutex_);
    token_.clear();
}

std::string AuthContext::generate_client_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << dist(engine)
        << std::setw(16) << dist(engine);
    return oss.str();
}

} // namespace panxfer::auth
