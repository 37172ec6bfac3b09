#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "lib/credit/credit_oracle.hpp"
#include "lib/engine/audit_sink.hpp"

#include "test_utils.hpp"

namespace
{

using namespace fhecredit::oracle;

const int kThreads = 8;
const int kIterations = 25;

class ConcurrencyTest : public ::testing::Test
{
protected:
    ConcurrencyTest()
        : oracle_(test::make_backend(),
                  test::make_identity(1),
                  test::make_identity(2),
                  std::make_shared<MemoryAuditSink>(),
                  std::make_shared<test::ManualClock>())
    {
    }

    OpaqueValue encrypt(uint64_t value) const { return oracle_.codec().encrypt(value); }

    uint64_t reveal(const OpaqueValue &value) const
    {
        return oracle_.codec().decrypt(oracle_.owner(), value);
    }

    CreditOracle oracle_;
};

TEST_F(ConcurrencyTest, IndependentOwnersScoreInParallel)
{
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++)
    {
        threads.emplace_back([this, t]() {
            const Identity owner = test::make_identity(static_cast<uint8_t>(10 + t));
            for (int i = 0; i < kIterations; i++)
            {
                oracle_.profiles().submit(
                    owner, encrypt(1000 + t), encrypt(500), encrypt(0), encrypt(i), encrypt(0));
                oracle_.compute_score(owner);
            }
        });
    }
    for (std::thread &thread : threads)
        thread.join();

    EXPECT_EQ(static_cast<size_t>(kThreads), oracle_.profiles().size());
    for (int t = 0; t < kThreads; t++)
    {
        const Identity owner = test::make_identity(static_cast<uint8_t>(10 + t));
        EXPECT_EQ(plaintext_credit_score(1000 + t, 500, kIterations - 1, 0),
                  reveal(oracle_.scoring().current_score(owner)));
    }
}

TEST_F(ConcurrencyTest, SameOwnerSeesCompleteProfiles)
{
    const Identity owner = test::make_identity(5);
    oracle_.profiles().submit(owner, encrypt(0), encrypt(0), encrypt(0), encrypt(0), encrypt(0));

    std::atomic<bool> torn(false);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++)
    {
        threads.emplace_back([this, t, &owner, &torn]() {
            for (int i = 0; i < kIterations; i++)
            {
                // Every submission carries the same value in all five fields
                const uint64_t value = static_cast<uint64_t>(t * kIterations + i);
                if (t % 2 == 0)
                {
                    oracle_.profiles().submit(owner,
                                              encrypt(value),
                                              encrypt(value),
                                              encrypt(value),
                                              encrypt(value),
                                              encrypt(value));
                }
                else
                {
                    const OpaqueValue score = oracle_.compute_score(owner);
                    const uint64_t revealed = reveal(score);
                    if (revealed % plaintext_credit_score(1, 1, 1, 1) != 0)
                        torn = true;
                }

                const CreditProfile profile = oracle_.profiles().get(owner);
                const uint64_t income = reveal(profile.income);
                if (reveal(profile.assets) != income || reveal(profile.debts) != income ||
                    reveal(profile.payment_history) != income ||
                    reveal(profile.credit_utilization) != income)
                    torn = true;
            }
        });
    }
    for (std::thread &thread : threads)
        thread.join();

    EXPECT_FALSE(torn);
    EXPECT_EQ(1u, oracle_.profiles().size());
}

TEST_F(ConcurrencyTest, AppendsGetGapFreeIds)
{
    std::mutex ids_mutex;
    std::vector<uint64_t> ids;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++)
    {
        threads.emplace_back([this, t, &ids_mutex, &ids]() {
            for (int i = 0; i < kIterations; i++)
            {
                const std::string name = "pool-" + std::to_string(t) + "-" + std::to_string(i);
                const uint64_t id = oracle_.pools().add_pool(oracle_.owner(),
                                                             oracle_.owner(),
                                                             encrypt(600),
                                                             encrypt(10000),
                                                             500,
                                                             name);
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.push_back(id);
            }
        });
    }
    for (std::thread &thread : threads)
        thread.join();

    const size_t expected = static_cast<size_t>(kThreads * kIterations);
    ASSERT_EQ(expected, ids.size());
    EXPECT_EQ(expected, oracle_.pools().size());

    std::sort(ids.begin(), ids.end());
    for (size_t i = 0; i < ids.size(); i++)
        EXPECT_EQ(i, ids[i]);

    std::set<std::string> names;
    for (const LendingPool &pool : *oracle_.pools().snapshot())
        names.insert(pool.name);
    EXPECT_EQ(expected, names.size());
}

TEST_F(ConcurrencyTest, MatchingDuringAppends)
{
    const OpaqueValue score = encrypt(700);
    std::atomic<bool> done(false);
    std::atomic<bool> out_of_range(false);

    std::thread writer([this, &done]() {
        for (int i = 0; i < kThreads * kIterations; i++)
        {
            oracle_.pools().add_pool(oracle_.owner(),
                                     oracle_.owner(),
                                     encrypt(static_cast<uint64_t>(i % 2 == 0 ? 600 : 800)),
                                     encrypt(10000),
                                     500,
                                     "pool-" + std::to_string(i));
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < kThreads / 2; t++)
    {
        readers.emplace_back([this, &score, &done, &out_of_range]() {
            while (!done)
            {
                const size_t size_before = oracle_.pools().size();
                const std::vector<uint64_t> matches = oracle_.find_matches(score);
                const size_t size_after = oracle_.pools().size();
                for (const uint64_t id : matches)
                {
                    // Only the even pools accept a score of 700
                    if (id >= size_after || id % 2 != 0)
                        out_of_range = true;
                }
                if (matches.size() < size_before / 2)
                    out_of_range = true;
            }
        });
    }

    writer.join();
    for (std::thread &reader : readers)
        reader.join();

    EXPECT_FALSE(out_of_range);
    EXPECT_EQ(static_cast<size_t>(kThreads * kIterations / 2),
              oracle_.find_matches(score).size());
}

} // namespace
