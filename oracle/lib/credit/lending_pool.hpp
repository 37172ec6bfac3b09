#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lib/common/identity.hpp"
#include "lib/crypto/opaque_value.hpp"

namespace fhecredit
{
namespace oracle
{

struct LendingPool
{
    Identity operator_id;
    OpaqueValue min_score;
    OpaqueValue max_loan;
    // Public business term, not subject data
    uint32_t interest_rate_bps = 0;
    bool active = true;
    std::string name;
};

// Immutable view of the registry; the pool id is the index
typedef std::shared_ptr<const std::vector<LendingPool>> PoolSnapshot;

} // namespace oracle
} // namespace fhecredit
