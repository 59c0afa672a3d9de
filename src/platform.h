#ifndef _PLATFORM_H
#define _PLATFORM_H

#include <stddef.h>
#include <stdint.h>

namespace Platform
{
    struct DateTime
    {
        uint16_t Year;
        uint16_t Month;
        uint16_t Day;
        uint16_t Hour;
        uint16_t Minute;
        uint16_t Second;
        uint16_t Millisecond;
    };

    // Returns false if the monotonic clock is unavailable
    bool Setup();
    void Shutdown();

    // Seconds elapsed since Setup() was called
    double SecondsSinceStartup();

    void SleepForMilliseconds(uint32_t milliseconds);

    DateTime GetLocalDateTime();
}

#endif
