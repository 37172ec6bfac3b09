#include "lib/engine/authorization_gate.hpp"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

AuthorizationGate::AuthorizationGate(const std::string &name,
                                     const Identity &owner,
                                     const AuditTrail &audit)
    : name_(name), owner_(owner), audit_(audit)
{
}

bool AuthorizationGate::is_authorized(const Identity &identity) const
{
    if (identity == owner_)
        return true;

    std::lock_guard<std::mutex> lock(mutex_);
    return authorized_.count(identity) == 1;
}

void AuthorizationGate::require_authorized(const Identity &identity) const
{
    if (!is_authorized(identity))
        THROW_EXCEPTION(kUnauthorizedCaller,
                        identity.to_hex() + " is not authorized on the " + name_ + " gate");
}

void AuthorizationGate::grant(const Identity &granter, const Identity &grantee)
{
    require_authorized(granter);

    if (grantee == owner_)
        return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!authorized_.insert(grantee).second)
            return;
    }

    INFO_LOG("%s granted %s on the %s gate",
             granter.to_hex().c_str(),
             grantee.to_hex().c_str(),
             name_.c_str());
    audit_.emit(name_ + ".grant", granter, grantee.to_vector());
}

size_t AuthorizationGate::grant_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return authorized_.size();
}

} // namespace oracle
} // namespace fhecredit
