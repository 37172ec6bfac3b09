#include "lib/credit/credit_oracle.hpp"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace
{

using namespace fhecredit::oracle;

std::unique_ptr<EncryptionBackend> require_backend(std::unique_ptr<EncryptionBackend> backend)
{
    if (!backend)
        THROW_EXCEPTION(kConfigurationError, "Credit oracle requires an encryption backend");
    return backend;
}

} // namespace

namespace fhecredit
{
namespace oracle
{

CreditOracle::CreditOracle(std::unique_ptr<EncryptionBackend> backend,
                           const Identity &owner,
                           const Identity &oracle_identity,
                           std::shared_ptr<AuditSink> audit_sink,
                           std::shared_ptr<const Clock> clock)
    : owner_(owner), oracle_identity_(oracle_identity),
      backend_(require_backend(std::move(backend))), audit_(audit_sink, clock),
      codec_(*backend_, owner_), engine_gate_("engine", owner_, audit_),
      registrar_gate_("registrar", owner_, audit_), engine_(*backend_, engine_gate_, audit_),
      profiles_(codec_, audit_), scoring_(engine_, profiles_, oracle_identity_),
      pools_(registrar_gate_, codec_, audit_), matcher_(engine_, pools_, oracle_identity_)
{
    if (owner_.is_zero() || oracle_identity_.is_zero())
        THROW_EXCEPTION(kConfigurationError, "Owner and oracle identities must be non-zero");

    engine_gate_.grant(owner_, oracle_identity_);
    INFO_LOG("Credit oracle %s deployed by %s using backend \"%s\"",
             oracle_identity_.to_hex().c_str(),
             owner_.to_hex().c_str(),
             backend_->name().c_str());
}

} // namespace oracle
} // namespace fhecredit
