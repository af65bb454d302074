#pragma once

#include "burnbox/tier_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace burnbox {

struct UserRecord {
    std::string id;
    Tier tier = Tier::free;
    bool admin = false;
    std::uint64_t total_transfers = 0;
    std::uint64_t first_seen = 0;
};

class UserDirectory {
public:
    explicit UserDirectory(const std::vector<std::string>& admin_ids);

    UserRecord touch(const std::string& id, Tier tier, std::uint64_t now);
    void set_tier(const std::string& id, Tier tier, std::uint64_t now);
    void count_transfer(const std::string& id);
    std::optional<UserRecord> find(const std::string& id) const;
    bool is_admin(const std::string& id) const;
    std::size_t size() const;

private:
    UserRecord& slot(const std::string& id, std::uint64_t now);

    std::unordered_set<std::string> admins_;
    std::unordered_map<std::string, UserRecord> users_;
    mutable std::mutex mu_;
};

}
