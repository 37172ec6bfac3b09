#include "service/oracle_service.hpp"

#include <exception>
#include <string>

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

#include "service/oracle_config.hpp"

namespace
{

using namespace fhecredit::oracle;

std::string to_bytes_string(const std::vector<uint8_t> &bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> to_byte_vector(const std::string &bytes)
{
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

Identity parse_identity(const std::string &bytes, const char *field)
{
    if (bytes.empty())
        THROW_EXCEPTION(kInvalidInput, std::string("Request field \"") + field + "\" is empty");

    return Identity::from_bytes(to_byte_vector(bytes));
}

void check_response(const void *response)
{
    if (response == nullptr)
        THROW_EXCEPTION(kInvalidInput, "Response pointer is null");
}

} // namespace

namespace fhecredit
{
namespace oracle
{

OracleStatusCode capture_exceptions(const std::function<void()> &logic)
{
    try
    {
        logic();
    }
    catch (const OracleException &e)
    {
        EXCEPTION_LOG(e);
        return e.get_code();
    }
    catch (const std::exception &e)
    {
        ERROR_LOG("%s", e.what());
        return kUnknownError;
    }

    return kSuccess;
}

OracleService::OracleService(std::unique_ptr<CreditOracle> oracle) : oracle_(std::move(oracle))
{
    if (!oracle_)
        THROW_EXCEPTION(kConfigurationError, "Oracle service requires an oracle");
}

OracleService::OracleService(const OracleConfig &config,
                             std::shared_ptr<AuditSink> audit_sink,
                             std::shared_ptr<const Clock> clock)
    : oracle_(create_oracle(config, audit_sink, clock))
{
}

OracleStatusCode OracleService::encrypt(const EncryptRequest &request,
                                        EncryptResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const OpaqueValue value = oracle_->codec().encrypt(request.value());
        response->set_value(to_bytes_string(value.bytes()));
    });
}

OracleStatusCode OracleService::grant_engine_access(const GrantRequest &request)
{
    return capture_exceptions([&]() {
        oracle_->engine_gate().grant(parse_identity(request.caller(), "caller"),
                                     parse_identity(request.grantee(), "grantee"));
    });
}

OracleStatusCode OracleService::grant_registrar(const GrantRequest &request)
{
    return capture_exceptions([&]() {
        oracle_->registrar_gate().grant(parse_identity(request.caller(), "caller"),
                                        parse_identity(request.grantee(), "grantee"));
    });
}

OracleStatusCode OracleService::submit_profile(const SubmitProfileRequest &request)
{
    return capture_exceptions([&]() {
        const Identity caller = parse_identity(request.caller(), "caller");
        const OpaqueValueCodec &codec = oracle_->codec();

        const OpaqueValue income = codec.parse(to_byte_vector(request.income()));
        const OpaqueValue assets = codec.parse(to_byte_vector(request.assets()));
        const OpaqueValue debts = codec.parse(to_byte_vector(request.debts()));
        const OpaqueValue payment_history = codec.parse(to_byte_vector(request.payment_history()));

        if (request.credit_utilization().empty())
        {
            oracle_->profiles().submit(caller, income, assets, debts, payment_history);
            return;
        }

        oracle_->profiles().submit(caller,
                                   income,
                                   assets,
                                   debts,
                                   payment_history,
                                   codec.parse(to_byte_vector(request.credit_utilization())));
    });
}

OracleStatusCode OracleService::get_profile(const GetProfileRequest &request,
                                            GetProfileResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const CreditProfile profile =
            oracle_->profiles().get(parse_identity(request.owner(), "owner"));

        CreditProfileInfo *info = response->mutable_profile();
        info->set_owner(to_bytes_string(profile.owner.to_vector()));
        info->set_income(to_bytes_string(profile.income.bytes()));
        info->set_assets(to_bytes_string(profile.assets.bytes()));
        info->set_debts(to_bytes_string(profile.debts.bytes()));
        info->set_payment_history(to_bytes_string(profile.payment_history.bytes()));
        info->set_credit_utilization(to_bytes_string(profile.credit_utilization.bytes()));
        if (profile.computed_score.has_value())
            info->set_computed_score(to_bytes_string(profile.computed_score.value().bytes()));
        info->set_score_stale(profile.score_stale);
        info->set_last_updated(profile.last_updated);
    });
}

OracleStatusCode OracleService::compute_score(const ComputeScoreRequest &request,
                                              ScoreResponse *response)
{
    return capture_exceptions([&]() {
        check_response(response);
        const OpaqueValue score =
            oracle_->compute_score(parse_identity(request.caller(), "caller"));
        response->set_score(to_bytes_string(score.bytes()));
    });
}

OracleStatusCode OracleService::add_pool(const AddPoolRequest &request, AddPoolResponse *response)
{
    return capture_exceptions([&]() {
        check_response(response);
        const OpaqueValueCodec &codec = oracle_->codec();
        const uint64_t pool_id =
            oracle_->pools().add_pool(parse_identity(request.caller(), "caller"),
                                      parse_identity(request.operator_identity(), "operator"),
                                      codec.parse(to_byte_vector(request.min_score())),
                                      codec.parse(to_byte_vector(request.max_loan())),
                                      request.interest_rate_bps(),
                                      request.name());
        response->set_pool_id(pool_id);
    });
}

OracleStatusCode OracleService::deactivate_pool(const DeactivatePoolRequest &request)
{
    return capture_exceptions([&]() {
        oracle_->pools().deactivate_pool(parse_identity(request.caller(), "caller"),
                                         request.pool_id());
    });
}

OracleStatusCode OracleService::list_pools(ListPoolsResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const PoolSnapshot pools = oracle_->pools().snapshot();
        for (uint64_t pool_id = 0; pool_id < pools->size(); pool_id++)
        {
            const LendingPool &pool = pools->at(pool_id);
            LendingPoolInfo *info = response->add_pools();
            info->set_pool_id(pool_id);
            info->set_operator_identity(to_bytes_string(pool.operator_id.to_vector()));
            info->set_min_score(to_bytes_string(pool.min_score.bytes()));
            info->set_max_loan(to_bytes_string(pool.max_loan.bytes()));
            info->set_interest_rate_bps(pool.interest_rate_bps);
            info->set_active(pool.active);
            info->set_name(pool.name);
        }
    });
}

OracleStatusCode OracleService::find_matches(const FindMatchesRequest &request,
                                             FindMatchesResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const OpaqueValue score = oracle_->codec().parse(to_byte_vector(request.score()));
        for (const uint64_t pool_id : oracle_->find_matches(score))
            response->add_pool_ids(pool_id);
    });
}

OracleStatusCode OracleService::optimal_loan_amount(const OptimalLoanRequest &request,
                                                    OptimalLoanResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const OpaqueValue score = oracle_->codec().parse(to_byte_vector(request.score()));
        const OpaqueValue amount = oracle_->optimal_loan_amount(score, request.pool_id());
        response->set_amount(to_bytes_string(amount.bytes()));
    });
}

OracleStatusCode OracleService::decrypt(const DecryptRequest &request,
                                        DecryptResponse *response) const
{
    return capture_exceptions([&]() {
        check_response(response);
        const Identity caller = parse_identity(request.caller(), "caller");
        const OpaqueValue value = oracle_->codec().parse(to_byte_vector(request.value()));
        response->set_value(oracle_->codec().decrypt(caller, value));
    });
}

} // namespace oracle
} // namespace fhecredit
