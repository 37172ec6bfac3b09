/*
 * Audit events and sinks
 *
 * Audit payloads never contain plaintext: they carry opaque values, pool ids, grantee identities
 * or comparison outcomes.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lib/common/clock.hpp"
#include "lib/common/identity.hpp"

namespace fhecredit
{
namespace oracle
{

struct AuditEvent
{
    std::string operation;
    Identity caller;
    std::vector<uint8_t> payload;
    int64_t timestamp = 0;

    // Canonical CBOR map {"caller", "operation", "payload", "timestamp"}
    std::vector<uint8_t> encode_cbor() const;
    static AuditEvent decode_cbor(const std::vector<uint8_t> &cbor);
};

class AuditSink
{
public:
    virtual ~AuditSink() {}
    virtual void record(const AuditEvent &event) = 0;
};

class MemoryAuditSink : public AuditSink
{
public:
    void record(const AuditEvent &event) override;

    std::vector<AuditEvent> events() const;
    size_t size() const;
    size_t count(const std::string &operation) const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditEvent> events_;
};

class LoggingAuditSink : public AuditSink
{
public:
    void record(const AuditEvent &event) override;
};

// Stamps events with the clock and forwards them to the sink. Sink failures are logged and
// never propagate to the operation being audited.
class AuditTrail
{
public:
    AuditTrail(std::shared_ptr<AuditSink> sink, std::shared_ptr<const Clock> clock);

    void emit(const std::string &operation,
              const Identity &caller,
              const std::vector<uint8_t> &payload) const;

    const Clock &clock() const { return *clock_; }

private:
    std::shared_ptr<AuditSink> sink_;
    std::shared_ptr<const Clock> clock_;
};

} // namespace oracle
} // namespace fhecredit
