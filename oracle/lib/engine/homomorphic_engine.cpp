#include "lib/engine/homomorphic_engine.hpp"

#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

HomomorphicEngine::HomomorphicEngine(const EncryptionBackend &backend,
                                     const AuthorizationGate &gate,
                                     const AuditTrail &audit)
    : backend_(backend), gate_(gate), audit_(audit)
{
}

OpaqueValue HomomorphicEngine::encrypt(const Identity &caller, uint64_t constant) const
{
    gate_.require_authorized(caller);

    OpaqueValue result = backend_.encrypt(constant);
    audit_.emit("engine.encrypt", caller, result.bytes());
    return result;
}

OpaqueValue
HomomorphicEngine::add(const Identity &caller, const OpaqueValue &a, const OpaqueValue &b) const
{
    gate_.require_authorized(caller);
    backend_.check_size(a);
    backend_.check_size(b);

    OpaqueValue result = backend_.add(a, b);
    audit_.emit("engine.add", caller, result.bytes());
    return result;
}

OpaqueValue
HomomorphicEngine::scalar_multiply(const Identity &caller, const OpaqueValue &a, uint64_t k) const
{
    gate_.require_authorized(caller);
    backend_.check_size(a);

    OpaqueValue result = backend_.scalar_multiply(a, k);
    audit_.emit("engine.scalar_multiply", caller, result.bytes());
    return result;
}

bool HomomorphicEngine::compare_at_least(const Identity &caller,
                                         const OpaqueValue &a,
                                         const OpaqueValue &b) const
{
    gate_.require_authorized(caller);
    backend_.check_size(a);
    backend_.check_size(b);

    const bool result = backend_.compare_at_least(a, b);
    audit_.emit("engine.compare_at_least", caller, {static_cast<uint8_t>(result ? 1 : 0)});
    return result;
}

uint64_t HomomorphicEngine::decrypt(const Identity &caller, const OpaqueValue &a) const
{
    gate_.require_authorized(caller);
    backend_.check_size(a);

    const uint64_t plaintext = backend_.decrypt(a);
    WARNING_LOG("Privileged decrypt performed by %s", caller.to_hex().c_str());
    audit_.emit("engine.decrypt", caller, a.bytes());
    return plaintext;
}

} // namespace oracle
} // namespace fhecredit
