#pragma once

#include <cstdint>

#include "lib/common/identity.hpp"
#include "lib/common/optional.hpp"
#include "lib/crypto/opaque_value.hpp"

namespace fhecredit
{
namespace oracle
{

struct CreditProfile
{
    Identity owner;

    OpaqueValue income;
    OpaqueValue assets;
    OpaqueValue debts;
    OpaqueValue payment_history;
    OpaqueValue credit_utilization;

    // Set only by the scoring pipeline
    Optional<OpaqueValue> computed_score;
    // The attributes were resubmitted after computed_score was produced
    bool score_stale = false;

    int64_t last_updated = 0;
    bool exists = false;
};

} // namespace oracle
} // namespace fhecredit
