#include "burnbox/user_directory.hpp"

#include <algorithm>

namespace burnbox {

UserDirectory::UserDirectory(const std::vector<std::string>& admin_ids) : admins_(admin_ids.begin(), admin_ids.end()) {}

UserRecord& UserDirectory::slot(const std::string& id, std::uint64_t now) {
    auto [it, fresh] = users_.try_emplace(id);
    auto& u = it->second;
    if (fresh) {
        u.id = id;
        u.first_seen = now;
        u.admin = admins_.count(id) != 0;
        u.tier = u.admin ? Tier::premium : Tier::free;
    }
    return u;
}

UserRecord UserDirectory::touch(const std::string& id, Tier tier, std::uint64_t now) {
    std::scoped_lock lock(mu_);
    auto& u = slot(id, now);
    u.tier = u.admin ? Tier::premium : std::max(u.tier, tier);
    return u;
}

void UserDirectory::set_tier(const std::string& id, Tier tier, std::uint64_t now) {
    std::scoped_lock lock(mu_);
    auto& u = slot(id, now);
    u.tier = u.admin ? Tier::premium : tier;
}

void UserDirectory::count_transfer(const std::string& id) {
    std::scoped_lock lock(mu_);
    const auto it = users_.find(id);
    if (it != users_.end()) {
        ++it->second.total_transfers;
    }
}

std::optional<UserRecord> UserDirectory::find(const std::string& id) const {
    std::scoped_lock lock(mu_);
    const auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UserDirectory::is_admin(const std::string& id) const {
    return admins_.count(id) != 0;
}

std::size_t UserDirectory::size() const {
    std::scoped_lock lock(mu_);
    return users_.size();
}

}
