// MINTGATE - Role-Based Access Control
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#ifndef MINTGATE_COLLECTION_ROLES_H
#define MINTGATE_COLLECTION_ROLES_H

#include <mintgate/core/types.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mintgate {
namespace collection {

enum class Role {
    /// Manages roles and parameters, executes withdrawals
    DefaultAdmin,

    /// Approves withdrawals and mints without sale restrictions
    Operator,
};

const char* RoleToString(Role role);
std::optional<Role> ParseRole(const std::string& str);

/// Membership sets per role
class AccessControl {
public:
    bool HasRole(Role role, const Address& account) const;

    /// Returns false if the account already held the role
    bool Grant(Role role, const Address& account);

    /// Returns false if the account did not hold the role
    bool Revoke(Role role, const Address& account);

    /// Members in address order
    std::vector<Address> GetMembers(Role role) const;

    size_t MemberCount(Role role) const;

private:
    std::map<Role, std::set<Address>> members_;
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_ROLES_H
