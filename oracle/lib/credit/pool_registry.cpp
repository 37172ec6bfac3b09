#include "lib/credit/pool_registry.hpp"

#include "include/fhecredit_constants.h"

#include "lib/common/encoders.hpp"
#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

PoolRegistry::PoolRegistry(const AuthorizationGate &registrar_gate,
                           const OpaqueValueCodec &codec,
                           const AuditTrail &audit)
    : registrar_gate_(registrar_gate), codec_(codec), audit_(audit),
      pools_(std::make_shared<std::vector<LendingPool>>())
{
}

uint64_t PoolRegistry::add_pool(const Identity &registrant,
                                const Identity &operator_id,
                                const OpaqueValue &min_score,
                                const OpaqueValue &max_loan,
                                uint32_t interest_rate_bps,
                                const std::string &name)
{
    registrar_gate_.require_authorized(registrant);

    codec_.check_size(min_score);
    codec_.check_size(max_loan);
    if (operator_id.is_zero())
        THROW_EXCEPTION(kInvalidInput, "Pool operator can't be the zero identity");
    if (interest_rate_bps > FHECREDIT_MAX_INTEREST_RATE_BPS)
        THROW_EXCEPTION(kInvalidInput,
                        "Interest rate of " + std::to_string(interest_rate_bps) +
                            " bps exceeds " + std::to_string(FHECREDIT_MAX_INTEREST_RATE_BPS));
    if (name.empty() || name.size() > FHECREDIT_MAX_POOL_NAME_LEN)
        THROW_EXCEPTION(kInvalidInput, "Pool name must be 1-64 characters");

    LendingPool pool;
    pool.operator_id = operator_id;
    pool.min_score = min_score;
    pool.max_loan = max_loan;
    pool.interest_rate_bps = interest_rate_bps;
    pool.active = true;
    pool.name = name;

    uint64_t pool_id;
    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        const PoolSnapshot current = snapshot();
        std::shared_ptr<std::vector<LendingPool>> next =
            std::make_shared<std::vector<LendingPool>>(*current);
        pool_id = next->size();
        next->push_back(pool);
        publish(next);
    }

    INFO_LOG("Registered lending pool %llu \"%s\" operated by %s",
             static_cast<unsigned long long>(pool_id),
             name.c_str(),
             operator_id.to_hex().c_str());
    audit_.emit("registry.add_pool", registrant, uint_to_be_bytes(pool_id, sizeof(uint64_t)));

    return pool_id;
}

void PoolRegistry::deactivate_pool(const Identity &caller, uint64_t pool_id)
{
    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        const PoolSnapshot current = snapshot();
        if (pool_id >= current->size())
            THROW_EXCEPTION(kInvalidPool, "No pool with id " + std::to_string(pool_id));

        const LendingPool &pool = current->at(pool_id);
        if (caller != pool.operator_id && caller != registrar_gate_.owner())
            THROW_EXCEPTION(kUnauthorizedCaller,
                            caller.to_hex() + " can't deactivate pool " + std::to_string(pool_id));

        if (!pool.active)
            return;

        std::shared_ptr<std::vector<LendingPool>> next =
            std::make_shared<std::vector<LendingPool>>(*current);
        next->at(pool_id).active = false;
        publish(next);
    }

    INFO_LOG("Deactivated lending pool %llu", static_cast<unsigned long long>(pool_id));
    audit_.emit("registry.deactivate_pool", caller, uint_to_be_bytes(pool_id, sizeof(uint64_t)));
}

LendingPool PoolRegistry::get_pool(uint64_t pool_id) const
{
    const PoolSnapshot pools = snapshot();
    if (pool_id >= pools->size())
        THROW_EXCEPTION(kInvalidPool, "No pool with id " + std::to_string(pool_id));

    return pools->at(pool_id);
}

size_t PoolRegistry::size() const { return snapshot()->size(); }

PoolSnapshot PoolRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return pools_;
}

void PoolRegistry::publish(PoolSnapshot pools)
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    pools_ = pools;
}

} // namespace oracle
} // namespace fhecredit
