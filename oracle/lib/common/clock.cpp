#include "lib/common/clock.hpp"

#include <time.h>

namespace fhecredit
{
namespace oracle
{

int64_t SystemClock::now() const { return static_cast<int64_t>(time(nullptr)); }

} // namespace oracle
} // namespace fhecredit
