#pragma once

#include <chrono>

namespace guestdrop {

/**
 * @brief Time source for session bookkeeping
 *
 * Injected into the session registry so staleness eviction can be driven
 * deterministically in tests.
 */
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock final : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

} // namespace guestdrop
