/*
 * Matches an opaque score against the lending pools without revealing it
 */

#pragma once

#include <cstdint>
#include <vector>

#include "lib/common/identity.hpp"
#include "lib/credit/pool_registry.hpp"
#include "lib/engine/homomorphic_engine.hpp"

namespace fhecredit
{
namespace oracle
{

class LoanMatcher
{
public:
    // identity is the principal the matcher presents to the engine
    LoanMatcher(const HomomorphicEngine &engine,
                const PoolRegistry &registry,
                const Identity &identity);

    // Ids of the active pools whose minimum score is at most score, in registration order
    std::vector<uint64_t> find_matches(const OpaqueValue &score) const;

    // min(score * FHECREDIT_LOAN_SCALE, pool maximum). Throws kInvalidPool or kPoolInactive.
    OpaqueValue optimal_loan_amount(const OpaqueValue &score, uint64_t pool_id) const;

private:
    const HomomorphicEngine &engine_;
    const PoolRegistry &registry_;
    const Identity identity_;
};

} // namespace oracle
} // namespace fhecredit
