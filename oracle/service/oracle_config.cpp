#include "service/oracle_config.hpp"

#include <fstream>
#include <iterator>

#include <google/protobuf/text_format.h>

#include "include/fhecredit_constants.h"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace
{

using namespace fhecredit::oracle;

void add_pool_definition(OracleConfig &config,
                         const std::string &name,
                         uint64_t min_score,
                         uint64_t max_loan,
                         uint32_t interest_rate_bps)
{
    PoolDefinition *pool = config.add_pools();
    pool->set_name(name);
    pool->set_min_score(min_score);
    pool->set_max_loan(max_loan);
    pool->set_interest_rate_bps(interest_rate_bps);
}

} // namespace

namespace fhecredit
{
namespace oracle
{

OracleConfig parse_config(const std::string &text)
{
    OracleConfig config;
    if (!google::protobuf::TextFormat::ParseFromString(text, &config))
        THROW_EXCEPTION(kConfigurationError, "Could not parse oracle configuration");

    if (config.owner_identity().empty() || config.oracle_identity().empty())
        THROW_EXCEPTION(kConfigurationError,
                        "Configuration requires owner_identity and oracle_identity");
    if (config.backend().empty())
        THROW_EXCEPTION(kConfigurationError, "Configuration requires a backend");

    return config;
}

OracleConfig load_config(const std::string &path)
{
    const std::vector<uint8_t> contents = read_file(path);
    return parse_config(std::string(contents.begin(), contents.end()));
}

OracleConfig default_config()
{
    OracleConfig config;
    config.set_owner_identity("0x00000000000000000000000000000000000000a1");
    config.set_oracle_identity("0x00000000000000000000000000000000000000c0");
    config.set_backend(FHECREDIT_SIMULATION_SCHEME);
    config.set_allow_insecure_backend(true);
    config.set_backend_seed("fhecredit-demo");
    config.set_log_level("info");

    add_pool_definition(config, "Conservative Pool", 600, 10000, 800);
    add_pool_definition(config, "Balanced Pool", 700, 25000, 600);
    add_pool_definition(config, "Premium Pool", 800, 50000, 400);

    return config;
}

BackendOptions backend_options(const OracleConfig &config)
{
    BackendOptions options;
    options.allow_insecure = config.allow_insecure_backend();
    options.seed.assign(config.backend_seed().begin(), config.backend_seed().end());
    if (!config.backend_key_file().empty())
        options.key_material = read_file(config.backend_key_file());

    return options;
}

std::unique_ptr<CreditOracle> create_oracle(const OracleConfig &config,
                                            std::shared_ptr<AuditSink> audit_sink,
                                            std::shared_ptr<const Clock> clock)
{
    set_log_level(parse_log_level(config.log_level()));

    const Identity owner = Identity::from_hex(config.owner_identity());
    const Identity oracle_identity = Identity::from_hex(config.oracle_identity());

    std::unique_ptr<CreditOracle> oracle(
        new CreditOracle(BackendFactory::create(config.backend(), backend_options(config)),
                         owner,
                         oracle_identity,
                         audit_sink,
                         clock));

    for (const PoolDefinition &definition : config.pools())
    {
        const Identity operator_id = definition.operator_identity().empty()
                                         ? owner
                                         : Identity::from_hex(definition.operator_identity());
        oracle->pools().add_pool(owner,
                                 operator_id,
                                 oracle->codec().encrypt(definition.min_score()),
                                 oracle->codec().encrypt(definition.max_loan()),
                                 definition.interest_rate_bps(),
                                 definition.name());
    }

    return oracle;
}

std::vector<uint8_t> read_file(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
        THROW_EXCEPTION(kConfigurationError, "Could not open \"" + path + "\"");

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

void write_file(const std::string &path, const std::vector<uint8_t> &data)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        THROW_EXCEPTION(kConfigurationError, "Could not open \"" + path + "\" for writing");

    file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file)
        THROW_EXCEPTION(kConfigurationError, "Could not write \"" + path + "\"");
}

} // namespace oracle
} // namespace fhecredit
