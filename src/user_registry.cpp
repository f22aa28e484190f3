#include "bourse/user_registry.hpp"
#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include <mutex>

namespace bourse {

Result<User> UserRegistry::create(std::string_view name) {
    auto check = FieldValidators::validate_name(name);
    if (check.has_error()) {
        return check.error();
    }

    auto id = Uuid::generate();
    if (id.has_error()) {
        return id.error();
    }

    User user{id.value(), std::string(name), std::chrono::system_clock::now()};

    std::unique_lock lock(mutex_);
    users_.emplace(user.id, user);
    LOG_INFO_SAFE("User {} registered as {}", user.name, user.id);
    return user;
}

Result<void> UserRegistry::remove(const UserID& user_id) {
    std::unique_lock lock(mutex_);
    if (users_.erase(user_id) == 0) {
        return ErrorCode::USER_NOT_FOUND;
    }
    return Result<void>();
}

std::optional<User> UserRegistry::find(const UserID& user_id) const {
    std::shared_lock lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UserRegistry::exists(const UserID& user_id) const {
    std::shared_lock lock(mutex_);
    return users_.count(user_id) > 0;
}

std::optional<User> UserRegistry::find_by_name(std::string_view name) const {
    std::shared_lock lock(mutex_);
    std::optional<User> best;
    for (const auto& [id, user] : users_) {
        if (user.name == name && (!best || user.created_at < best->created_at)) {
            best = user;
        }
    }
    return best;
}

size_t UserRegistry::size() const {
    std::shared_lock lock(mutex_);
    return users_.size();
}

} // namespace bourse
