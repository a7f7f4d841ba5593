#pragma once

#include <chrono>

namespace tiergate
{
    /**
     * Time source seam. Wall time drives license expiry and cache age;
     * monotonic time drives in-process TTLs.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual std::chrono::system_clock::time_point now() const = 0;
        virtual std::chrono::steady_clock::time_point steady_now() const = 0;

        /** Wall time as fractional epoch seconds */
        double epoch_seconds() const
        {
            return std::chrono::duration<double>(now().time_since_epoch()).count();
        }
    };

    class SystemClock : public Clock
    {
    public:
        std::chrono::system_clock::time_point now() const override
        {
            return std::chrono::system_clock::now();
        }

        std::chrono::steady_clock::time_point steady_now() const override
        {
            return std::chrono::steady_clock::now();
        }
    };

} // namespace tiergate
