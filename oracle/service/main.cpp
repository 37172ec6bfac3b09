/*
 * fhecredit_oracle host program
 *
 *   fhecredit_oracle <config.textproto> keygen <file>
 *   fhecredit_oracle <config.textproto> pools
 *   fhecredit_oracle <config.textproto> score <income> <assets> <debts> <payment_history>
 *                                             <utilization>
 */

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "include/fhecredit_status_message.h"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"
#include "lib/crypto/simulated_backend.hpp"

#include "service/oracle_config.hpp"
#include "service/oracle_service.hpp"

namespace
{

using namespace fhecredit::oracle;

void print_usage(const char *program)
{
    fprintf(stderr,
            "Usage: %s <config.textproto> keygen <file>\n"
            "       %s <config.textproto> pools\n"
            "       %s <config.textproto> score <income> <assets> <debts> <payment_history> "
            "<utilization>\n",
            program,
            program,
            program);
}

uint64_t parse_uint(const char *arg)
{
    if (arg[0] == '\0' || arg[0] == '-')
        THROW_EXCEPTION(kInvalidInput, std::string("Invalid unsigned integer \"") + arg + "\"");

    errno = 0;
    char *end = nullptr;
    const unsigned long long value = strtoull(arg, &end, 10);
    if (errno != 0 || *end != '\0')
        THROW_EXCEPTION(kInvalidInput, std::string("Invalid unsigned integer \"") + arg + "\"");

    return static_cast<uint64_t>(value);
}

void run_keygen(const std::string &path)
{
    write_file(path, SimulatedBackend::generate()->export_key_material());
    printf("Wrote %s key material to %s\n", FHECREDIT_SIMULATION_SCHEME, path.c_str());
}

void run_pools(const CreditOracle &oracle)
{
    const OpaqueValueCodec &codec = oracle.codec();
    const PoolSnapshot pools = oracle.pools().snapshot();

    printf("%zu lending pools\n", pools->size());
    for (size_t pool_id = 0; pool_id < pools->size(); pool_id++)
    {
        const LendingPool &pool = pools->at(pool_id);
        printf("  [%zu] %-20s min_score=%llu max_loan=%llu rate=%u bps operator=%s%s\n",
               pool_id,
               pool.name.c_str(),
               static_cast<unsigned long long>(codec.decrypt(oracle.owner(), pool.min_score)),
               static_cast<unsigned long long>(codec.decrypt(oracle.owner(), pool.max_loan)),
               pool.interest_rate_bps,
               pool.operator_id.to_hex().c_str(),
               pool.active ? "" : " (inactive)");
    }
}

void run_score(CreditOracle &oracle, char **args)
{
    const OpaqueValueCodec &codec = oracle.codec();
    const Identity &owner = oracle.owner();

    oracle.profiles().submit(owner,
                             codec.encrypt(parse_uint(args[0])),
                             codec.encrypt(parse_uint(args[1])),
                             codec.encrypt(parse_uint(args[2])),
                             codec.encrypt(parse_uint(args[3])),
                             codec.encrypt(parse_uint(args[4])));

    const OpaqueValue score = oracle.compute_score(owner);
    printf("Score for %s: %llu\n",
           owner.to_hex().c_str(),
           static_cast<unsigned long long>(codec.decrypt(owner, score)));

    const std::vector<uint64_t> matches = oracle.find_matches(score);
    if (matches.empty())
    {
        printf("No matching lending pools\n");
        return;
    }

    for (const uint64_t pool_id : matches)
    {
        const LendingPool pool = oracle.pools().get_pool(pool_id);
        const OpaqueValue amount = oracle.optimal_loan_amount(score, pool_id);
        printf("  [%llu] %-20s loan=%llu rate=%u bps\n",
               static_cast<unsigned long long>(pool_id),
               pool.name.c_str(),
               static_cast<unsigned long long>(codec.decrypt(owner, amount)),
               pool.interest_rate_bps);
    }
}

} // namespace

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string command = argv[2];
    OracleStatusCode status = kSuccess;

    if (command == "keygen" && argc == 4)
    {
        status = capture_exceptions([&]() { run_keygen(argv[3]); });
    }
    else if (command == "pools" && argc == 3)
    {
        status = capture_exceptions([&]() {
            OracleService service(load_config(argv[1]));
            run_pools(service.oracle());
        });
    }
    else if (command == "score" && argc == 8)
    {
        status = capture_exceptions([&]() {
            OracleService service(load_config(argv[1]));
            run_score(service.oracle(), argv + 3);
        });
    }
    else
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (status != kSuccess)
    {
        fprintf(stderr,
                "%s: %s\n",
                oracle_status_name(status),
                oracle_status_message(status));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
