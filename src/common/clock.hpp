#pragma once

#include <chrono>
#include <string>

namespace daybreak {

// Time source for the reset engine: the current instant plus the user's
// resolved IANA timezone id.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual std::string timeZoneId() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    std::string timeZoneId() const override;
};

} // namespace daybreak
