/*
 * Oracle configuration: protobuf text format on disk
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lib/common/clock.hpp"
#include "lib/credit/credit_oracle.hpp"
#include "lib/crypto/backend_factory.hpp"
#include "lib/engine/audit_sink.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#pragma GCC diagnostic pop

namespace fhecredit
{
namespace oracle
{

OracleConfig parse_config(const std::string &text);
OracleConfig load_config(const std::string &path);

// Simulation backend with the Conservative, Balanced and Premium demo pools
OracleConfig default_config();

BackendOptions backend_options(const OracleConfig &config);

// Create the oracle, apply the log level and register the configured pools
std::unique_ptr<CreditOracle> create_oracle(const OracleConfig &config,
                                            std::shared_ptr<AuditSink> audit_sink,
                                            std::shared_ptr<const Clock> clock);

std::vector<uint8_t> read_file(const std::string &path);
void write_file(const std::string &path, const std::vector<uint8_t> &data);

} // namespace oracle
} // namespace fhecredit
