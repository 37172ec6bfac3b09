/*
 * Request handlers over the credit oracle
 *
 * Each handler validates its request, runs the operation and converts any exception into a
 * status code. Response messages are only filled in on kSuccess.
 */

#pragma once

#include <functional>
#include <memory>

#include "include/fhecredit_status_codes.h"

#include "lib/common/clock.hpp"
#include "lib/credit/credit_oracle.hpp"
#include "lib/engine/audit_sink.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#include "proto/requests.pb.h"
#pragma GCC diagnostic pop

namespace fhecredit
{
namespace oracle
{

OracleStatusCode capture_exceptions(const std::function<void()> &logic);

class OracleService
{
public:
    explicit OracleService(std::unique_ptr<CreditOracle> oracle);

    // Audit events go to the log and timestamps to the system clock unless overridden
    explicit OracleService(
        const OracleConfig &config,
        std::shared_ptr<AuditSink> audit_sink = std::make_shared<LoggingAuditSink>(),
        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    OracleStatusCode encrypt(const EncryptRequest &request, EncryptResponse *response) const;
    OracleStatusCode grant_engine_access(const GrantRequest &request);
    OracleStatusCode grant_registrar(const GrantRequest &request);

    OracleStatusCode submit_profile(const SubmitProfileRequest &request);
    OracleStatusCode get_profile(const GetProfileRequest &request,
                                 GetProfileResponse *response) const;
    OracleStatusCode compute_score(const ComputeScoreRequest &request, ScoreResponse *response);

    OracleStatusCode add_pool(const AddPoolRequest &request, AddPoolResponse *response);
    OracleStatusCode deactivate_pool(const DeactivatePoolRequest &request);
    OracleStatusCode list_pools(ListPoolsResponse *response) const;

    OracleStatusCode find_matches(const FindMatchesRequest &request,
                                  FindMatchesResponse *response) const;
    OracleStatusCode optimal_loan_amount(const OptimalLoanRequest &request,
                                         OptimalLoanResponse *response) const;

    // Owner only
    OracleStatusCode decrypt(const DecryptRequest &request, DecryptResponse *response) const;

    CreditOracle &oracle() { return *oracle_; }

private:
    std::unique_ptr<CreditOracle> oracle_;
};

} // namespace oracle
} // namespace fhecredit
