/*
 * Monotonic authorization set
 *
 * Identities only ever move from unauthorized to authorized. The owner is always authorized and
 * any authorized identity may grant others. There is no revocation.
 */

#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

#include "lib/common/identity.hpp"
#include "lib/engine/audit_sink.hpp"

namespace fhecredit
{
namespace oracle
{

class AuthorizationGate
{
public:
    // name identifies the gate in logs and audit events, e.g. "engine"
    AuthorizationGate(const std::string &name, const Identity &owner, const AuditTrail &audit);

    AuthorizationGate(const AuthorizationGate &) = delete;
    AuthorizationGate &operator=(const AuthorizationGate &) = delete;

    bool is_authorized(const Identity &identity) const;

    // Throws kUnauthorizedCaller if identity isn't authorized
    void require_authorized(const Identity &identity) const;

    // Granting an identity that is already authorized is a no-op
    void grant(const Identity &granter, const Identity &grantee);

    const Identity &owner() const { return owner_; }
    const std::string &name() const { return name_; }

    // Number of explicit grants, excluding the owner
    size_t grant_count() const;

private:
    const std::string name_;
    const Identity owner_;
    const AuditTrail &audit_;

    mutable std::mutex mutex_;
    std::unordered_set<Identity, IdentityHash> authorized_;
};

} // namespace oracle
} // namespace fhecredit
