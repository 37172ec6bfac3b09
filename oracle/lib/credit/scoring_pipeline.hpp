/*
 * Weighted credit score computed entirely through the homomorphic engine
 *
 *    score = (35 * payment_history + 3 * income + 20 * credit_utilization + 15 * assets) * 100
 *
 * The weights are fixed so that the same profile contents always give the same opaque score
 * under a deterministic backend. Debts are stored with the profile but don't enter the score.
 */

#pragma once

#include <cstdint>

#include "lib/common/identity.hpp"
#include "lib/credit/profile_store.hpp"
#include "lib/engine/homomorphic_engine.hpp"

namespace fhecredit
{
namespace oracle
{

class ScoringPipeline
{
public:
    // identity is the principal the pipeline presents to the engine
    ScoringPipeline(const HomomorphicEngine &engine, ProfileStore &store, const Identity &identity);

    // Compute, store and return the score for owner's current profile.
    // Throws kProfileNotFound if owner has never submitted a profile.
    OpaqueValue compute_score(const Identity &owner);

    // The stored score. Throws kProfileNotFound, kScoreNotComputed or kStaleScore.
    OpaqueValue current_score(const Identity &owner) const;

private:
    const HomomorphicEngine &engine_;
    ProfileStore &store_;
    const Identity identity_;
};

// The same computation over plaintexts, throwing kIntegerOverflow where the engine would
uint64_t plaintext_credit_score(uint64_t income,
                                uint64_t assets,
                                uint64_t payment_history,
                                uint64_t credit_utilization);

} // namespace oracle
} // namespace fhecredit
