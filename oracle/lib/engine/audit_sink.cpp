#include "lib/engine/audit_sink.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "lib/common/cbor_map.hpp"
#include "lib/common/date_time.hpp"
#include "lib/common/encoders.hpp"
#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

std::vector<uint8_t> AuditEvent::encode_cbor() const
{
    if (timestamp < 0)
        THROW_EXCEPTION(kEncodingError, "Audit event timestamp predates the epoch");

    CBORMap cbor;
    cbor.insert("operation", operation);
    cbor.insert("caller", caller.to_vector());
    cbor.insert("payload", payload);
    cbor.insert("timestamp", static_cast<uint64_t>(timestamp));

    return cbor.encode_cbor();
}

AuditEvent AuditEvent::decode_cbor(const std::vector<uint8_t> &cbor)
{
    const CBORMap map(cbor, {"operation", "caller", "payload", "timestamp"});

    AuditEvent event;
    event.operation = map.get("operation").get_text_string_value();
    event.caller = Identity::from_bytes(map.get("caller").get_byte_string_value());
    event.payload = map.get("payload").get_byte_string_value();
    const uint64_t timestamp = map.get("timestamp").get_uint_value();
    if (timestamp > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        THROW_EXCEPTION(kDecodingError, "Audit event timestamp out of range");
    event.timestamp = static_cast<int64_t>(timestamp);

    return event;
}

void MemoryAuditSink::record(const AuditEvent &event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<AuditEvent> MemoryAuditSink::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t MemoryAuditSink::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t MemoryAuditSink::count(const std::string &operation) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(events_.begin(), events_.end(), [&operation](const AuditEvent &event) {
            return event.operation == operation;
        }));
}

void LoggingAuditSink::record(const AuditEvent &event)
{
    INFO_LOG("audit %s %s by %s: %s",
             timestamp_to_iso8601(event.timestamp).c_str(),
             event.operation.c_str(),
             event.caller.to_hex().c_str(),
             hex_encode(event.encode_cbor()).c_str());
}

AuditTrail::AuditTrail(std::shared_ptr<AuditSink> sink, std::shared_ptr<const Clock> clock)
    : sink_(sink), clock_(clock)
{
    if (!clock_)
        THROW_EXCEPTION(kInvalidInput, "Audit trail requires a clock");
}

void AuditTrail::emit(const std::string &operation,
                      const Identity &caller,
                      const std::vector<uint8_t> &payload) const
{
    if (!sink_)
        return;

    AuditEvent event;
    event.operation = operation;
    event.caller = caller;
    event.payload = payload;
    event.timestamp = clock_->now();

    try
    {
        sink_->record(event);
    }
    catch (const std::exception &e)
    {
        WARNING_LOG("Audit sink failed to record \"%s\": %s", operation.c_str(), e.what());
    }
}

} // namespace oracle
} // namespace fhecredit
