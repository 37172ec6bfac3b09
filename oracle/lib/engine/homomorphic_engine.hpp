/*
 * Homomorphic arithmetic over opaque values
 *
 * Every operation requires the caller to be authorized on the engine gate, validates the size of
 * each opaque argument and audits its (non-plaintext) result.
 */

#pragma once

#include <cstdint>

#include "lib/common/identity.hpp"
#include "lib/crypto/encryption_backend.hpp"
#include "lib/engine/audit_sink.hpp"
#include "lib/engine/authorization_gate.hpp"

namespace fhecredit
{
namespace oracle
{

class HomomorphicEngine
{
public:
    HomomorphicEngine(const EncryptionBackend &backend,
                      const AuthorizationGate &gate,
                      const AuditTrail &audit);

    // Encrypt a public constant for use as an operand
    OpaqueValue encrypt(const Identity &caller, uint64_t constant) const;

    OpaqueValue add(const Identity &caller, const OpaqueValue &a, const OpaqueValue &b) const;
    OpaqueValue scalar_multiply(const Identity &caller, const OpaqueValue &a, uint64_t k) const;

    // plaintext(a) >= plaintext(b); neither plaintext leaves the backend
    bool compare_at_least(const Identity &caller, const OpaqueValue &a, const OpaqueValue &b) const;

    // Privileged: for audit and testing only, never on the scoring or matching path
    uint64_t decrypt(const Identity &caller, const OpaqueValue &a) const;

    const EncryptionBackend &backend() const { return backend_; }

private:
    const EncryptionBackend &backend_;
    const AuthorizationGate &gate_;
    const AuditTrail &audit_;
};

} // namespace oracle
} // namespace fhecredit
