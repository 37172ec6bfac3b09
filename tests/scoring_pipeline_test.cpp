#include <gtest/gtest.h>

#include <limits>
#include <memory>

#include "lib/credit/credit_oracle.hpp"
#include "lib/credit/scoring_pipeline.hpp"
#include "lib/engine/audit_sink.hpp"

#include "test_utils.hpp"

namespace
{

using namespace fhecredit::oracle;

class ScoringPipelineTest : public ::testing::Test
{
protected:
    ScoringPipelineTest()
        : sink_(std::make_shared<MemoryAuditSink>()),
          oracle_(test::make_backend(),
                  test::make_identity(1),
                  test::make_identity(2),
                  sink_,
                  std::make_shared<test::ManualClock>()),
          borrower_(test::make_identity(5))
    {
    }

    void submit(const Identity &owner,
                uint64_t income,
                uint64_t assets,
                uint64_t debts,
                uint64_t payment_history,
                uint64_t credit_utilization)
    {
        const OpaqueValueCodec &codec = oracle_.codec();
        oracle_.profiles().submit(owner,
                                  codec.encrypt(income),
                                  codec.encrypt(assets),
                                  codec.encrypt(debts),
                                  codec.encrypt(payment_history),
                                  codec.encrypt(credit_utilization));
    }

    uint64_t reveal(const OpaqueValue &value) const
    {
        return oracle_.codec().decrypt(oracle_.owner(), value);
    }

    std::shared_ptr<MemoryAuditSink> sink_;
    CreditOracle oracle_;
    const Identity borrower_;
};

TEST_F(ScoringPipelineTest, WeightedScore)
{
    submit(borrower_, 50000, 100000, 20000, 85, 30);
    const OpaqueValue score = oracle_.compute_score(borrower_);

    // (85 * 35 + 50000 * 3 + 30 * 20 + 100000 * 15) * 100
    EXPECT_EQ(165357500u, reveal(score));
    EXPECT_EQ(plaintext_credit_score(50000, 100000, 85, 30), reveal(score));
}

TEST_F(ScoringPipelineTest, FourValueProfileScoresWithZeroUtilization)
{
    const OpaqueValueCodec &codec = oracle_.codec();
    oracle_.profiles().submit(borrower_,
                              codec.encrypt(50000),
                              codec.encrypt(100000),
                              codec.encrypt(20000),
                              codec.encrypt(85));

    EXPECT_EQ(165297500u, reveal(oracle_.compute_score(borrower_)));
}

TEST_F(ScoringPipelineTest, MatchesPlaintextComputation)
{
    struct Case
    {
        uint64_t income, assets, payment_history, credit_utilization;
    };
    const Case cases[] = {{0, 0, 0, 0}, {1, 0, 0, 0}, {72000, 5000, 60, 95}, {2, 0, 0, 0}};

    for (const Case &c : cases)
    {
        submit(borrower_, c.income, c.assets, 0, c.payment_history, c.credit_utilization);
        EXPECT_EQ(plaintext_credit_score(c.income, c.assets, c.payment_history, c.credit_utilization),
                  reveal(oracle_.compute_score(borrower_)));
    }
}

TEST_F(ScoringPipelineTest, DebtsDoNotEnterScore)
{
    const Identity other = test::make_identity(6);
    submit(borrower_, 50000, 100000, 0, 85, 30);
    submit(other, 50000, 100000, 999999, 85, 30);

    EXPECT_EQ(oracle_.compute_score(borrower_), oracle_.compute_score(other));
}

TEST_F(ScoringPipelineTest, IdenticalProfilesGiveIdenticalScores)
{
    submit(borrower_, 50000, 100000, 20000, 85, 30);
    const OpaqueValue first = oracle_.compute_score(borrower_);
    const OpaqueValue second = oracle_.compute_score(borrower_);

    EXPECT_EQ(first, second);
}

TEST_F(ScoringPipelineTest, MissingProfile)
{
    EXPECT_ORACLE_ERROR(oracle_.compute_score(borrower_), kProfileNotFound);
    EXPECT_ORACLE_ERROR(oracle_.scoring().current_score(borrower_), kProfileNotFound);
}

TEST_F(ScoringPipelineTest, MissingProfileLeavesNoOwnerLock)
{
    for (uint8_t seed = 10; seed < 20; seed++)
        EXPECT_ORACLE_ERROR(oracle_.compute_score(test::make_identity(seed)), kProfileNotFound);
    EXPECT_EQ(0u, oracle_.profiles().owner_lock_count());

    submit(borrower_, 50000, 100000, 20000, 85, 30);
    oracle_.compute_score(borrower_);
    EXPECT_EQ(1u, oracle_.profiles().owner_lock_count());
}

TEST_F(ScoringPipelineTest, StoresScoreAndTracksStaleness)
{
    submit(borrower_, 50000, 100000, 20000, 85, 30);
    EXPECT_ORACLE_ERROR(oracle_.scoring().current_score(borrower_), kScoreNotComputed);

    const OpaqueValue score = oracle_.compute_score(borrower_);
    EXPECT_EQ(score, oracle_.scoring().current_score(borrower_));
    EXPECT_EQ(score, oracle_.profiles().get(borrower_).computed_score.value());

    submit(borrower_, 60000, 100000, 20000, 85, 30);
    EXPECT_ORACLE_ERROR(oracle_.scoring().current_score(borrower_), kStaleScore);

    const OpaqueValue updated = oracle_.compute_score(borrower_);
    EXPECT_NE(score, updated);
    EXPECT_EQ(updated, oracle_.scoring().current_score(borrower_));
    EXPECT_FALSE(oracle_.profiles().get(borrower_).score_stale);
}

TEST_F(ScoringPipelineTest, RunsUnderOracleIdentity)
{
    submit(borrower_, 50000, 100000, 20000, 85, 30);
    const size_t before = sink_->size();
    oracle_.compute_score(borrower_);

    const std::vector<AuditEvent> events = sink_->events();
    ASSERT_EQ(before + 8, events.size());
    for (size_t i = before; i < events.size(); i++)
        EXPECT_EQ(oracle_.oracle_identity(), events[i].caller);
    EXPECT_EQ(5u, sink_->count("engine.scalar_multiply"));
    EXPECT_EQ(3u, sink_->count("engine.add"));
}

TEST_F(ScoringPipelineTest, Overflow)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    submit(borrower_, max, 0, 0, 0, 0);

    EXPECT_ORACLE_ERROR(oracle_.compute_score(borrower_), kIntegerOverflow);
    EXPECT_ORACLE_ERROR(plaintext_credit_score(max, 0, 0, 0), kIntegerOverflow);
    EXPECT_FALSE(oracle_.profiles().get(borrower_).computed_score.has_value());
}

TEST(CreditOracleTest, GrantsOracleEngineAccess)
{
    const Identity owner = test::make_identity(1);
    const Identity oracle_identity = test::make_identity(2);
    CreditOracle oracle(test::make_backend(),
                        owner,
                        oracle_identity,
                        std::make_shared<MemoryAuditSink>(),
                        std::make_shared<test::ManualClock>());

    EXPECT_TRUE(oracle.engine_gate().is_authorized(oracle_identity));
    EXPECT_FALSE(oracle.registrar_gate().is_authorized(oracle_identity));
    EXPECT_EQ(owner, oracle.registrar_gate().owner());
    EXPECT_EQ(FHECREDIT_SIMULATION_SCHEME, oracle.backend().name());
}

TEST(CreditOracleTest, RejectsBadConstruction)
{
    const auto clock = std::make_shared<test::ManualClock>();
    EXPECT_ORACLE_ERROR(CreditOracle(std::unique_ptr<EncryptionBackend>(),
                                     test::make_identity(1),
                                     test::make_identity(2),
                                     nullptr,
                                     clock),
                        kConfigurationError);
    EXPECT_ORACLE_ERROR(CreditOracle(test::make_backend(),
                                     Identity(),
                                     test::make_identity(2),
                                     nullptr,
                                     clock),
                        kConfigurationError);
}

} // namespace
