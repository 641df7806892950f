#pragma once

#include <chrono>

using TimePoint = std::chrono::steady_clock::time_point;

// Time source for expiry decisions. Tests substitute a manually advanced clock.
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};
