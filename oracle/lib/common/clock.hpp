#pragma once

#include <cstdint>

namespace fhecredit
{
namespace oracle
{

class Clock
{
public:
    virtual ~Clock() {}

    // Seconds since Jan 01 1970 (UTC)
    virtual int64_t now() const = 0;
};

class SystemClock : public Clock
{
public:
    int64_t now() const override;
};

} // namespace oracle
} // namespace fhecredit
