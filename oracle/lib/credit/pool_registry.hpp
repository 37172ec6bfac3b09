/*
 * Append-only registry of lending pools
 *
 * A pool's id is its insertion index; ids are never reused and pools are never removed, only
 * deactivated. Mutations are serialized and publish a new snapshot, so readers that took a
 * snapshot are never blocked by a pending append.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "lib/common/identity.hpp"
#include "lib/credit/lending_pool.hpp"
#include "lib/crypto/opaque_value_codec.hpp"
#include "lib/engine/audit_sink.hpp"
#include "lib/engine/authorization_gate.hpp"

namespace fhecredit
{
namespace oracle
{

class PoolRegistry
{
public:
    PoolRegistry(const AuthorizationGate &registrar_gate,
                 const OpaqueValueCodec &codec,
                 const AuditTrail &audit);

    PoolRegistry(const PoolRegistry &) = delete;
    PoolRegistry &operator=(const PoolRegistry &) = delete;

    // registrant must be authorized on the registrar gate
    uint64_t add_pool(const Identity &registrant,
                      const Identity &operator_id,
                      const OpaqueValue &min_score,
                      const OpaqueValue &max_loan,
                      uint32_t interest_rate_bps,
                      const std::string &name);

    // caller must be the pool operator or the registrar gate owner
    void deactivate_pool(const Identity &caller, uint64_t pool_id);

    // Throws kInvalidPool
    LendingPool get_pool(uint64_t pool_id) const;
    size_t size() const;
    PoolSnapshot snapshot() const;

private:
    void publish(PoolSnapshot pools);

    const AuthorizationGate &registrar_gate_;
    const OpaqueValueCodec &codec_;
    const AuditTrail &audit_;

    // Serializes mutations
    std::mutex writer_mutex_;
    // Guards only the snapshot pointer
    mutable std::mutex snapshot_mutex_;
    PoolSnapshot pools_;
};

} // namespace oracle
} // namespace fhecredit
