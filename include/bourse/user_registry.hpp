#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bourse {

class UserRegistry {
public:
    Result<User> create(std::string_view name);
    Result<void> remove(const UserID& user_id);

    std::optional<User> find(const UserID& user_id) const;
    bool exists(const UserID& user_id) const;

    // Names are not unique; returns the earliest registered match
    std::optional<User> find_by_name(std::string_view name) const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<UserID, User> users_ GUARDED_BY(mutex_);
};

} // namespace bourse
