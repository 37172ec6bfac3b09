#include "lib/credit/scoring_pipeline.hpp"

#include <limits>

#include "include/fhecredit_constants.h"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace
{

using namespace fhecredit::oracle;

uint64_t checked_add(uint64_t a, uint64_t b)
{
    if (a > std::numeric_limits<uint64_t>::max() - b)
        THROW_EXCEPTION(kIntegerOverflow, "Score term sum overflows");
    return a + b;
}

uint64_t checked_multiply(uint64_t a, uint64_t k)
{
    if (k != 0 && a > std::numeric_limits<uint64_t>::max() / k)
        THROW_EXCEPTION(kIntegerOverflow, "Score term overflows");
    return a * k;
}

} // namespace

namespace fhecredit
{
namespace oracle
{

ScoringPipeline::ScoringPipeline(const HomomorphicEngine &engine,
                                 ProfileStore &store,
                                 const Identity &identity)
    : engine_(engine), store_(store), identity_(identity)
{
}

OpaqueValue ScoringPipeline::compute_score(const Identity &owner)
{
    // Profiles are never removed, so an owner seen here stays valid under the lock
    if (!store_.exists(owner))
        THROW_EXCEPTION(kProfileNotFound, "No profile for " + owner.to_hex());

    std::unique_lock<std::mutex> owner_lock = store_.lock_owner(owner);
    const CreditProfile profile = store_.get(owner);

    const OpaqueValue payment_term = engine_.scalar_multiply(
        identity_, profile.payment_history, FHECREDIT_PAYMENT_HISTORY_WEIGHT);
    const OpaqueValue income_term =
        engine_.scalar_multiply(identity_, profile.income, FHECREDIT_INCOME_WEIGHT);
    const OpaqueValue utilization_term = engine_.scalar_multiply(
        identity_, profile.credit_utilization, FHECREDIT_UTILIZATION_WEIGHT);
    const OpaqueValue asset_term =
        engine_.scalar_multiply(identity_, profile.assets, FHECREDIT_ASSET_WEIGHT);

    OpaqueValue total = engine_.add(identity_, payment_term, income_term);
    total = engine_.add(identity_, total, utilization_term);
    total = engine_.add(identity_, total, asset_term);

    const OpaqueValue score =
        engine_.scalar_multiply(identity_, total, FHECREDIT_SCORE_SCALE_NUMERATOR);

    store_.store_computed_score(owner, score);
    DEBUG_LOG("Score computed for %s", owner.to_hex().c_str());
    DEBUG_HEX_LOG("Opaque score", score.bytes().data(), score.size());

    return score;
}

OpaqueValue ScoringPipeline::current_score(const Identity &owner) const
{
    const CreditProfile profile = store_.get(owner);
    if (!profile.computed_score.has_value())
        THROW_EXCEPTION(kScoreNotComputed, "No score computed for " + owner.to_hex());
    if (profile.score_stale)
        THROW_EXCEPTION(kStaleScore,
                        "Profile for " + owner.to_hex() + " was resubmitted after scoring");

    return profile.computed_score.value();
}

uint64_t plaintext_credit_score(uint64_t income,
                                uint64_t assets,
                                uint64_t payment_history,
                                uint64_t credit_utilization)
{
    uint64_t total = checked_multiply(payment_history, FHECREDIT_PAYMENT_HISTORY_WEIGHT);
    total = checked_add(total, checked_multiply(income, FHECREDIT_INCOME_WEIGHT));
    total = checked_add(total, checked_multiply(credit_utilization, FHECREDIT_UTILIZATION_WEIGHT));
    total = checked_add(total, checked_multiply(assets, FHECREDIT_ASSET_WEIGHT));

    return checked_multiply(total, FHECREDIT_SCORE_SCALE_NUMERATOR);
}

} // namespace oracle
} // namespace fhecredit
