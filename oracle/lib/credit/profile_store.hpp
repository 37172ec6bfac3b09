/*
 * Per-owner store of encrypted credit profiles
 *
 * Profiles are published as immutable records, so a reader always sees either the previous or the
 * new complete profile. Submissions for one owner serialize on that owner's mutex, which the
 * scoring pipeline also holds while it computes.
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "lib/common/clock.hpp"
#include "lib/common/identity.hpp"
#include "lib/credit/credit_profile.hpp"
#include "lib/crypto/opaque_value_codec.hpp"
#include "lib/engine/audit_sink.hpp"

namespace fhecredit
{
namespace oracle
{

class ProfileStore
{
public:
    ProfileStore(const OpaqueValueCodec &codec, const AuditTrail &audit);

    ProfileStore(const ProfileStore &) = delete;
    ProfileStore &operator=(const ProfileStore &) = delete;

    // Self-service write of owner's own profile. Credit utilization is set to an encrypted zero.
    void submit(const Identity &owner,
                const OpaqueValue &income,
                const OpaqueValue &assets,
                const OpaqueValue &debts,
                const OpaqueValue &payment_history);

    void submit(const Identity &owner,
                const OpaqueValue &income,
                const OpaqueValue &assets,
                const OpaqueValue &debts,
                const OpaqueValue &payment_history,
                const OpaqueValue &credit_utilization);

    // Throws kProfileNotFound
    CreditProfile get(const Identity &owner) const;
    bool exists(const Identity &owner) const;
    size_t size() const;

    // Caller must hold lock_owner(owner). Clears the stale flag.
    void store_computed_score(const Identity &owner, const OpaqueValue &score);

    std::unique_lock<std::mutex> lock_owner(const Identity &owner);
    // Number of owners with a per-owner lock
    size_t owner_lock_count() const;

private:
    std::shared_ptr<const CreditProfile> find(const Identity &owner) const;

    const OpaqueValueCodec &codec_;
    const AuditTrail &audit_;

    mutable std::mutex mutex_;
    std::unordered_map<Identity, std::shared_ptr<const CreditProfile>, IdentityHash> profiles_;
    std::unordered_map<Identity, std::shared_ptr<std::mutex>, IdentityHash> owner_mutexes_;
};

} // namespace oracle
} // namespace fhecredit
