#include "lib/credit/profile_store.hpp"

#include <initializer_list>

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"
#include "lib/crypto/hash.hpp"

namespace fhecredit
{
namespace oracle
{

ProfileStore::ProfileStore(const OpaqueValueCodec &codec, const AuditTrail &audit)
    : codec_(codec), audit_(audit)
{
}

void ProfileStore::submit(const Identity &owner,
                          const OpaqueValue &income,
                          const OpaqueValue &assets,
                          const OpaqueValue &debts,
                          const OpaqueValue &payment_history)
{
    submit(owner, income, assets, debts, payment_history, codec_.encrypt(0));
}

void ProfileStore::submit(const Identity &owner,
                          const OpaqueValue &income,
                          const OpaqueValue &assets,
                          const OpaqueValue &debts,
                          const OpaqueValue &payment_history,
                          const OpaqueValue &credit_utilization)
{
    if (owner.is_zero())
        THROW_EXCEPTION(kInvalidInput, "Profile owner can't be the zero identity");

    // Validate everything before anything is published
    for (const OpaqueValue *value : {&income, &assets, &debts, &payment_history, &credit_utilization})
        codec_.check_size(*value);

    std::unique_lock<std::mutex> owner_lock = lock_owner(owner);

    std::shared_ptr<CreditProfile> profile = std::make_shared<CreditProfile>();
    profile->owner = owner;
    profile->income = income;
    profile->assets = assets;
    profile->debts = debts;
    profile->payment_history = payment_history;
    profile->credit_utilization = credit_utilization;
    profile->last_updated = audit_.clock().now();
    profile->exists = true;

    const std::shared_ptr<const CreditProfile> previous = find(owner);
    if (previous && previous->computed_score.has_value())
    {
        profile->computed_score = previous->computed_score;
        profile->score_stale = true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        profiles_[owner] = profile;
    }

    std::vector<uint8_t> commitment;
    for (const OpaqueValue *value : {&income, &assets, &debts, &payment_history, &credit_utilization})
        commitment.insert(commitment.end(), value->bytes().begin(), value->bytes().end());
    const auto digest = Hash::get_SHA_256_digest(commitment);

    DEBUG_LOG("Profile submitted for %s", owner.to_hex().c_str());
    audit_.emit("profile.submit", owner, std::vector<uint8_t>(digest.begin(), digest.end()));
}

std::shared_ptr<const CreditProfile> ProfileStore::find(const Identity &owner) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto iter = profiles_.find(owner);
    if (iter == profiles_.end())
        return nullptr;

    return iter->second;
}

CreditProfile ProfileStore::get(const Identity &owner) const
{
    const std::shared_ptr<const CreditProfile> profile = find(owner);
    if (!profile || !profile->exists)
        THROW_EXCEPTION(kProfileNotFound, "No profile for " + owner.to_hex());

    return *profile;
}

bool ProfileStore::exists(const Identity &owner) const
{
    const std::shared_ptr<const CreditProfile> profile = find(owner);
    return profile && profile->exists;
}

size_t ProfileStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

void ProfileStore::store_computed_score(const Identity &owner, const OpaqueValue &score)
{
    codec_.check_size(score);

    const std::shared_ptr<const CreditProfile> previous = find(owner);
    if (!previous || !previous->exists)
        THROW_EXCEPTION(kProfileNotFound, "No profile for " + owner.to_hex());

    std::shared_ptr<CreditProfile> profile = std::make_shared<CreditProfile>(*previous);
    profile->computed_score = score;
    profile->score_stale = false;

    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[owner] = profile;
}

size_t ProfileStore::owner_lock_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_mutexes_.size();
}

std::unique_lock<std::mutex> ProfileStore::lock_owner(const Identity &owner)
{
    std::shared_ptr<std::mutex> owner_mutex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::shared_ptr<std::mutex> &entry = owner_mutexes_[owner];
        if (!entry)
            entry = std::make_shared<std::mutex>();
        owner_mutex = entry;
    }

    // Entries are never erased, so the mutex outlives the lock
    return std::unique_lock<std::mutex>(*owner_mutex);
}

} // namespace oracle
} // namespace fhecredit
