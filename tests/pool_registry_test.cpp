#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "lib/common/encoders.hpp"
#include "lib/credit/credit_oracle.hpp"
#include "lib/engine/audit_sink.hpp"

#include "test_utils.hpp"

namespace
{

using namespace fhecredit::oracle;

class PoolRegistryTest : public ::testing::Test
{
protected:
    PoolRegistryTest()
        : sink_(std::make_shared<MemoryAuditSink>()),
          oracle_(test::make_backend(),
                  test::make_identity(1),
                  test::make_identity(2),
                  sink_,
                  std::make_shared<test::ManualClock>()),
          owner_(oracle_.owner()), operator_(test::make_identity(7)),
          stranger_(test::make_identity(8))
    {
    }

    uint64_t add_pool(uint64_t min_score, uint64_t max_loan, const std::string &name)
    {
        return oracle_.pools().add_pool(owner_,
                                        operator_,
                                        encrypt(min_score),
                                        encrypt(max_loan),
                                        500,
                                        name);
    }

    OpaqueValue encrypt(uint64_t value) const { return oracle_.codec().encrypt(value); }

    uint64_t reveal(const OpaqueValue &value) const
    {
        return oracle_.codec().decrypt(owner_, value);
    }

    std::shared_ptr<MemoryAuditSink> sink_;
    CreditOracle oracle_;
    const Identity owner_;
    const Identity operator_;
    const Identity stranger_;
};

TEST_F(PoolRegistryTest, IdsAreInsertionIndices)
{
    EXPECT_EQ(0u, add_pool(600, 10000, "A"));
    EXPECT_EQ(1u, add_pool(800, 50000, "B"));
    EXPECT_EQ(2u, oracle_.pools().size());

    const LendingPool pool = oracle_.pools().get_pool(1);
    EXPECT_EQ("B", pool.name);
    EXPECT_EQ(operator_, pool.operator_id);
    EXPECT_EQ(800u, reveal(pool.min_score));
    EXPECT_EQ(50000u, reveal(pool.max_loan));
    EXPECT_EQ(500u, pool.interest_rate_bps);
    EXPECT_TRUE(pool.active);

    const AuditEvent event = sink_->events().back();
    EXPECT_EQ("registry.add_pool", event.operation);
    EXPECT_EQ(owner_, event.caller);
    EXPECT_EQ(uint_to_be_bytes(1, 8), event.payload);
}

TEST_F(PoolRegistryTest, MatchesEligiblePools)
{
    add_pool(600, 10000, "A");
    add_pool(800, 50000, "B");

    EXPECT_EQ(std::vector<uint64_t>({0}), oracle_.find_matches(encrypt(700)));
    EXPECT_EQ(std::vector<uint64_t>({0, 1}), oracle_.find_matches(encrypt(800)));
    EXPECT_TRUE(oracle_.find_matches(encrypt(599)).empty());
}

TEST_F(PoolRegistryTest, EmptyRegistryMatchesNothing)
{
    EXPECT_TRUE(oracle_.find_matches(encrypt(1000000)).empty());
    EXPECT_ORACLE_ERROR(oracle_.find_matches(OpaqueValue()), kMalformedCiphertext);
}

TEST_F(PoolRegistryTest, InactivePoolsSkipped)
{
    add_pool(600, 10000, "A");
    add_pool(800, 50000, "B");
    add_pool(700, 25000, "C");

    oracle_.pools().deactivate_pool(operator_, 0);
    EXPECT_FALSE(oracle_.pools().get_pool(0).active);
    EXPECT_EQ(std::vector<uint64_t>({1, 2}), oracle_.find_matches(encrypt(900)));
    EXPECT_EQ(3u, oracle_.pools().size());
}

TEST_F(PoolRegistryTest, DeactivationRules)
{
    add_pool(600, 10000, "A");
    add_pool(800, 50000, "B");

    EXPECT_ORACLE_ERROR(oracle_.pools().deactivate_pool(stranger_, 0), kUnauthorizedCaller);
    EXPECT_ORACLE_ERROR(oracle_.pools().deactivate_pool(operator_, 2), kInvalidPool);

    // Registry owner may deactivate any pool
    oracle_.pools().deactivate_pool(owner_, 1);
    oracle_.pools().deactivate_pool(operator_, 1);
    EXPECT_EQ(1u, sink_->count("registry.deactivate_pool"));
    EXPECT_TRUE(oracle_.pools().get_pool(0).active);
}

TEST_F(PoolRegistryTest, RegistrationRequiresRegistrar)
{
    EXPECT_ORACLE_ERROR(oracle_.pools().add_pool(
                            stranger_, stranger_, encrypt(600), encrypt(10000), 500, "Mine"),
                        kUnauthorizedCaller);
    EXPECT_EQ(0u, oracle_.pools().size());

    oracle_.registrar_gate().grant(owner_, stranger_);
    EXPECT_EQ(0u,
              oracle_.pools().add_pool(
                  stranger_, stranger_, encrypt(600), encrypt(10000), 500, "Mine"));
}

TEST_F(PoolRegistryTest, RejectsInvalidPools)
{
    PoolRegistry &pools = oracle_.pools();
    const OpaqueValue min_score = encrypt(600);
    const OpaqueValue max_loan = encrypt(10000);

    EXPECT_ORACLE_ERROR(pools.add_pool(owner_, operator_, min_score, max_loan, 10001, "A"),
                        kInvalidInput);
    EXPECT_ORACLE_ERROR(pools.add_pool(owner_, operator_, min_score, max_loan, 500, ""),
                        kInvalidInput);
    EXPECT_ORACLE_ERROR(
        pools.add_pool(owner_, operator_, min_score, max_loan, 500, std::string(65, 'p')),
        kInvalidInput);
    EXPECT_ORACLE_ERROR(pools.add_pool(owner_, Identity(), min_score, max_loan, 500, "A"),
                        kInvalidInput);
    EXPECT_ORACLE_ERROR(pools.add_pool(owner_, operator_, OpaqueValue(), max_loan, 500, "A"),
                        kMalformedCiphertext);
    EXPECT_EQ(0u, pools.size());

    EXPECT_EQ(0u, pools.add_pool(owner_, operator_, min_score, max_loan, 10000, std::string(64, 'p')));
}

TEST_F(PoolRegistryTest, UnknownPool)
{
    EXPECT_ORACLE_ERROR(oracle_.pools().get_pool(0), kInvalidPool);
    EXPECT_ORACLE_ERROR(oracle_.optimal_loan_amount(encrypt(700), 0), kInvalidPool);
}

TEST_F(PoolRegistryTest, OptimalLoanAmountIsCapped)
{
    add_pool(600, 10000, "A");

    EXPECT_EQ(7000u, reveal(oracle_.optimal_loan_amount(encrypt(700), 0)));
    EXPECT_EQ(10000u, reveal(oracle_.optimal_loan_amount(encrypt(1000), 0)));

    const OpaqueValue capped = oracle_.optimal_loan_amount(encrypt(2500), 0);
    EXPECT_EQ(oracle_.pools().get_pool(0).max_loan, capped);
}

TEST_F(PoolRegistryTest, OptimalLoanAmountOfInactivePool)
{
    add_pool(600, 10000, "A");
    oracle_.pools().deactivate_pool(operator_, 0);
    EXPECT_ORACLE_ERROR(oracle_.optimal_loan_amount(encrypt(700), 0), kPoolInactive);
}

TEST_F(PoolRegistryTest, SnapshotIsImmutable)
{
    add_pool(600, 10000, "A");
    const PoolSnapshot before = oracle_.pools().snapshot();

    add_pool(800, 50000, "B");
    oracle_.pools().deactivate_pool(operator_, 0);

    EXPECT_EQ(1u, before->size());
    EXPECT_TRUE(before->at(0).active);
    EXPECT_EQ(2u, oracle_.pools().snapshot()->size());
}

TEST_F(PoolRegistryTest, MatchingRunsUnderOracleIdentity)
{
    add_pool(600, 10000, "A");
    add_pool(800, 50000, "B");
    const size_t before = sink_->size();

    oracle_.find_matches(encrypt(700));

    const std::vector<AuditEvent> events = sink_->events();
    ASSERT_EQ(before + 2, events.size());
    EXPECT_EQ(oracle_.oracle_identity(), events[before].caller);
    EXPECT_EQ(std::vector<uint8_t>({1}), events[before].payload);
    EXPECT_EQ(std::vector<uint8_t>({0}), events[before + 1].payload);
}

TEST_F(PoolRegistryTest, ScoredProfileEndToEnd)
{
    add_pool(600, 10000, "Conservative Pool");
    add_pool(700, 25000, "Balanced Pool");
    add_pool(800, 50000, "Premium Pool");

    // (0 * 35 + 2 * 3 + 0 * 20 + 0 * 15) * 100 = 600
    const Identity borrower = test::make_identity(5);
    oracle_.profiles().submit(borrower, encrypt(2), encrypt(0), encrypt(0), encrypt(0));
    const OpaqueValue score = oracle_.compute_score(borrower);

    EXPECT_EQ(std::vector<uint64_t>({0}), oracle_.find_matches(score));
    EXPECT_EQ(6000u, reveal(oracle_.optimal_loan_amount(score, 0)));
}

TEST_F(PoolRegistryTest, LargeScoreReturnsCap)
{
    add_pool(600, 10000, "Conservative Pool");

    // 2e15 * 15 * 100 = 3e18, ten times that does not fit in 64 bits
    const Identity borrower = test::make_identity(5);
    oracle_.profiles().submit(
        borrower, encrypt(0), encrypt(2000000000000000ULL), encrypt(0), encrypt(0));
    const OpaqueValue score = oracle_.compute_score(borrower);

    EXPECT_EQ(std::vector<uint64_t>({0}), oracle_.find_matches(score));
    EXPECT_EQ(10000u, reveal(oracle_.optimal_loan_amount(score, 0)));

    // Largest score whose scaled amount still fits
    const uint64_t boundary = std::numeric_limits<uint64_t>::max() / 10;
    EXPECT_EQ(10000u, reveal(oracle_.optimal_loan_amount(encrypt(boundary), 0)));
    EXPECT_EQ(10000u, reveal(oracle_.optimal_loan_amount(encrypt(boundary + 1), 0)));
    EXPECT_EQ(10000u,
              reveal(oracle_.optimal_loan_amount(encrypt(std::numeric_limits<uint64_t>::max()), 0)));
}

} // namespace
