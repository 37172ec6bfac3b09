#include "lib/credit/loan_matcher.hpp"

#include <limits>

#include "include/fhecredit_constants.h"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

LoanMatcher::LoanMatcher(const HomomorphicEngine &engine,
                         const PoolRegistry &registry,
                         const Identity &identity)
    : engine_(engine), registry_(registry), identity_(identity)
{
}

std::vector<uint64_t> LoanMatcher::find_matches(const OpaqueValue &score) const
{
    engine_.backend().check_size(score);

    const PoolSnapshot pools = registry_.snapshot();
    std::vector<uint64_t> matches;
    for (uint64_t pool_id = 0; pool_id < pools->size(); pool_id++)
    {
        const LendingPool &pool = pools->at(pool_id);
        if (!pool.active)
            continue;

        if (engine_.compare_at_least(identity_, score, pool.min_score))
            matches.push_back(pool_id);
    }

    DEBUG_LOG("Score matched %zu of %zu pools", matches.size(), pools->size());
    return matches;
}

OpaqueValue LoanMatcher::optimal_loan_amount(const OpaqueValue &score, uint64_t pool_id) const
{
    const PoolSnapshot pools = registry_.snapshot();
    if (pool_id >= pools->size())
        THROW_EXCEPTION(kInvalidPool, "No pool with id " + std::to_string(pool_id));

    const LendingPool &pool = pools->at(pool_id);
    if (!pool.active)
        THROW_EXCEPTION(kPoolInactive, "Pool " + std::to_string(pool_id) + " is inactive");

    // Any score whose scaled amount would overflow is above every representable cap
    const OpaqueValue overflow_bound =
        engine_.encrypt(identity_, std::numeric_limits<uint64_t>::max() / FHECREDIT_LOAN_SCALE + 1);
    if (engine_.compare_at_least(identity_, score, overflow_bound))
        return pool.max_loan;

    const OpaqueValue candidate = engine_.scalar_multiply(identity_, score, FHECREDIT_LOAN_SCALE);
    if (engine_.compare_at_least(identity_, candidate, pool.max_loan))
        return pool.max_loan;

    return candidate;
}

} // namespace oracle
} // namespace fhecredit
