/*
 * Confidential credit oracle
 *
 * Owns the encryption backend and wires the codec, engine, authorization gates, profile store,
 * scoring pipeline, pool registry and matcher together. The oracle identity is granted engine
 * access by the owner at construction and is the principal the pipeline and matcher present to
 * the engine.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lib/common/clock.hpp"
#include "lib/common/identity.hpp"
#include "lib/credit/loan_matcher.hpp"
#include "lib/credit/pool_registry.hpp"
#include "lib/credit/profile_store.hpp"
#include "lib/credit/scoring_pipeline.hpp"
#include "lib/crypto/encryption_backend.hpp"
#include "lib/crypto/opaque_value_codec.hpp"
#include "lib/engine/audit_sink.hpp"
#include "lib/engine/authorization_gate.hpp"
#include "lib/engine/homomorphic_engine.hpp"

namespace fhecredit
{
namespace oracle
{

class CreditOracle
{
public:
    CreditOracle(std::unique_ptr<EncryptionBackend> backend,
                 const Identity &owner,
                 const Identity &oracle_identity,
                 std::shared_ptr<AuditSink> audit_sink,
                 std::shared_ptr<const Clock> clock);

    CreditOracle(const CreditOracle &) = delete;
    CreditOracle &operator=(const CreditOracle &) = delete;

    const Identity &owner() const { return owner_; }
    const Identity &oracle_identity() const { return oracle_identity_; }

    const EncryptionBackend &backend() const { return *backend_; }
    const OpaqueValueCodec &codec() const { return codec_; }
    const HomomorphicEngine &engine() const { return engine_; }
    AuthorizationGate &engine_gate() { return engine_gate_; }
    AuthorizationGate &registrar_gate() { return registrar_gate_; }
    ProfileStore &profiles() { return profiles_; }
    const ProfileStore &profiles() const { return profiles_; }
    ScoringPipeline &scoring() { return scoring_; }
    PoolRegistry &pools() { return pools_; }
    const PoolRegistry &pools() const { return pools_; }
    const LoanMatcher &matcher() const { return matcher_; }

    // The caller's own score for its current profile
    OpaqueValue compute_score(const Identity &caller) { return scoring_.compute_score(caller); }

    std::vector<uint64_t> find_matches(const OpaqueValue &score) const
    {
        return matcher_.find_matches(score);
    }

    OpaqueValue optimal_loan_amount(const OpaqueValue &score, uint64_t pool_id) const
    {
        return matcher_.optimal_loan_amount(score, pool_id);
    }

private:
    const Identity owner_;
    const Identity oracle_identity_;
    std::unique_ptr<EncryptionBackend> backend_;
    AuditTrail audit_;

    OpaqueValueCodec codec_;
    AuthorizationGate engine_gate_;
    AuthorizationGate registrar_gate_;
    HomomorphicEngine engine_;
    ProfileStore profiles_;
    ScoringPipeline scoring_;
    PoolRegistry pools_;
    LoanMatcher matcher_;
};

} // namespace oracle
} // namespace fhecredit
