// MINTGATE - Role-Based Access Control Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/roles.h>

#include <algorithm>
#include <cctype>

namespace mintgate {
namespace collection {

const char* RoleToString(Role role) {
    switch (role) {
        case Role::DefaultAdmin: return "admin";
        case Role::Operator: return "operator";
        default: return "unknown";
    }
}

std::optional<Role> ParseRole(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "admin" || lower == "defaultadmin") return Role::DefaultAdmin;
    if (lower == "operator") return Role::Operator;
    return std::nullopt;
}

bool AccessControl::HasRole(Role role, const Address& account) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(account) > 0;
}

bool AccessControl::Grant(Role role, const Address& account) {
    return members_[role].insert(account).second;
}

bool AccessControl::Revoke(Role role, const Address& account) {
    auto it = members_.find(role);
    if (it == members_.end()) {
        return false;
    }
    return it->second.erase(account) > 0;
}

std::vector<Address> AccessControl::GetMembers(Role role) const {
    auto it = members_.find(role);
    if (it == members_.end()) {
        return {};
    }
    return std::vector<Address>(it->second.begin(), it->second.end());
}

size_t AccessControl::MemberCount(Role role) const {
    auto it = members_.find(role);
    return it != members_.end() ? it->second.size() : 0;
}

} // namespace collection
} // namespace mintgate
